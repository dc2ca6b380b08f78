#include "linkmint/db.h"

#include <folly/Conv.h>
#include <folly/Range.h>
#include <glog/logging.h>
#include <limits>
#include <stdexcept>

namespace linkmint {
namespace db {

namespace {
auto to_store_error(const rocksdb::Status &s) -> TokenStoreError {
  if (s.IsNotFound()) {
    return TokenStoreError::NotFound;
  }
  if (s.IsIOError()) {
    return TokenStoreError::IOError;
  }
  if (s.IsTryAgain() || s.IsBusy()) {
    return TokenStoreError::TryAgain;
  }
  if (s.IsCorruption()) {
    return TokenStoreError::Corruption;
  }
  return TokenStoreError::InternalRocksDbError;
}
} // namespace

auto token_store_error_name(TokenStoreError err) noexcept -> std::string_view {
  switch (err) {
  case TokenStoreError::NotFound:
    return "not found";
  case TokenStoreError::TryAgain:
    return "try again";
  case TokenStoreError::IOError:
    return "I/O error";
  case TokenStoreError::Corruption:
    return "corruption";
  case TokenStoreError::InternalRocksDbError:
    return "internal RocksDB error";
  case TokenStoreError::AlreadyExists:
    return "token already exists";
  }
  return "unknown store error";
}

auto ShortenedUrlsDatabase::open(const std::filesystem::path &db_path)
    -> std::shared_ptr<ShortenedUrlsDatabase> {
  LOG(INFO) << "Opening token store, a RocksDB database at path "
            << std::filesystem::absolute(db_path);
  rocksdb::DBOptions options;
  options.create_if_missing = true;
  options.create_missing_column_families = true;
  options.IncreaseParallelism();

  rocksdb::ColumnFamilyOptions cf_options;
  cf_options.OptimizeLevelStyleCompaction();
  std::vector<rocksdb::ColumnFamilyDescriptor> families{
      {rocksdb::kDefaultColumnFamilyName, cf_options},
      {counters_column_family, rocksdb::ColumnFamilyOptions{}},
  };

  rocksdb::DB *db = nullptr;
  std::vector<rocksdb::ColumnFamilyHandle *> handles;
  rocksdb::Status s =
      rocksdb::DB::Open(options, db_path.string(), families, &handles, &db);
  if (!s.ok()) {
    LOG(ERROR) << "Unable to open RocksDB database at \"" << db_path
               << "\" : " << s.ToString();
    throw std::runtime_error{s.ToString()};
  }
  return std::shared_ptr<ShortenedUrlsDatabase>(
      new ShortenedUrlsDatabase{db, std::move(handles), db_path});
}

ShortenedUrlsDatabase::~ShortenedUrlsDatabase() {
  if (rocksdb_ == nullptr) {
    return;
  }
  for (auto *handle : handles_) {
    rocksdb::Status s = rocksdb_->DestroyColumnFamilyHandle(handle);
    LOG_IF(ERROR, !s.ok()) << s.ToString();
  }
  rocksdb::Status s = rocksdb_->Close();
  if (!s.ok()) {
    LOG(ERROR) << s.ToString();
  }
  delete rocksdb_;
}

auto ShortenedUrlsDatabase::put(std::string_view token,
                                std::string_view long_url) noexcept
    -> std::variant<std::monostate, TokenStoreError> {
  DLOG(INFO) << "Putting token into RocksDB \"" << token << "\" -> \""
             << long_url << "\"";
  const rocksdb::Slice key{token.data(), token.size()};
  std::lock_guard<std::mutex> guard{put_mu_};

  std::string existing;
  rocksdb::Status s =
      rocksdb_->Get(rocksdb::ReadOptions(), urls(), key, &existing);
  if (s.ok()) {
    LOG(ERROR) << "token \"" << token << "\" is already mapped to \""
               << existing << "\"";
    return TokenStoreError::AlreadyExists;
  }
  if (!s.IsNotFound()) {
    LOG(ERROR) << "RocksDB lookup of token \"" << token
               << "\" failed: " << s.ToString();
    return to_store_error(s);
  }

  s = rocksdb_->Put(rocksdb::WriteOptions(), urls(), key,
                    rocksdb::Slice{long_url.data(), long_url.size()});
  if (!s.ok()) {
    LOG(ERROR) << "RocksDB put of token \"" << token
               << "\" failed: " << s.ToString();
    return to_store_error(s);
  }
  return std::monostate{};
}

auto ShortenedUrlsDatabase::get(std::string_view token) noexcept
    -> std::variant<std::string, TokenStoreError> {
  DLOG(INFO) << "Getting from RocksDB database this token: \"" << token
             << "\"";
  std::string dst;
  rocksdb::Status s = rocksdb_->Get(rocksdb::ReadOptions(), urls(),
                                    rocksdb::Slice{token.data(), token.size()},
                                    &dst);
  if (!s.ok()) {
    DLOG(INFO) << s.ToString();
    return to_store_error(s);
  }
  return dst;
}

auto ShortenedUrlsDatabase::increment_counter(std::string_view name,
                                              std::uint64_t first_value) noexcept
    -> std::variant<std::uint64_t, TokenStoreError> {
  const rocksdb::Slice key{name.data(), name.size()};
  std::lock_guard<std::mutex> guard{counter_mu_};

  std::string current;
  rocksdb::Status s =
      rocksdb_->Get(rocksdb::ReadOptions(), counters(), key, &current);
  std::uint64_t next = first_value;
  if (s.ok()) {
    auto parsed = folly::tryTo<std::uint64_t>(folly::StringPiece{current});
    if (!parsed) {
      LOG(ERROR) << "counter \"" << name
                 << "\" holds a non-numeric value: \"" << current << "\"";
      return TokenStoreError::Corruption;
    }
    if (*parsed == std::numeric_limits<std::uint64_t>::max()) {
      LOG(ERROR) << "counter \"" << name << "\" is exhausted";
      return TokenStoreError::InternalRocksDbError;
    }
    next = *parsed + 1;
  } else if (!s.IsNotFound()) {
    LOG(ERROR) << "reading counter \"" << name << "\" failed: " << s.ToString();
    return to_store_error(s);
  } else {
    LOG(INFO) << "counter \"" << name << "\" starts at " << first_value;
  }

  rocksdb::WriteOptions write_opts;
  write_opts.sync = true;
  s = rocksdb_->Put(write_opts, counters(), key, folly::to<std::string>(next));
  if (!s.ok()) {
    LOG(ERROR) << "writing counter \"" << name << "\" failed: " << s.ToString();
    return to_store_error(s);
  }
  return next;
}

} // namespace db
} // namespace linkmint
