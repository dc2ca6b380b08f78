#ifndef _INCLUDE_LINKMINT_DB_H
#define _INCLUDE_LINKMINT_DB_H

#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace linkmint {
namespace db {
enum class TokenStoreError {
  NotFound,
  TryAgain,
  IOError,
  Corruption,
  InternalRocksDbError,
  // `put` of a token that is already mapped.
  AlreadyExists,
};

auto token_store_error_name(TokenStoreError err) noexcept -> std::string_view;

// Token -> long URL mapping, plus the named counters identifiers are drawn
// from. Tokens live in the default column family, counters in "counters".
class ShortenedUrlsDatabase {
private:
  rocksdb::DB *rocksdb_;
  std::vector<rocksdb::ColumnFamilyHandle *> handles_;
  std::filesystem::path path_;
  std::mutex counter_mu_;
  std::mutex put_mu_;
  explicit ShortenedUrlsDatabase(
      rocksdb::DB *rocksdb, std::vector<rocksdb::ColumnFamilyHandle *> handles,
      std::filesystem::path path)
      : rocksdb_(rocksdb), handles_(std::move(handles)),
        path_(std::move(path)) {}

  auto urls() const -> rocksdb::ColumnFamilyHandle * { return handles_[0]; }
  auto counters() const -> rocksdb::ColumnFamilyHandle * {
    return handles_[1];
  }

public:
  static constexpr const char *counters_column_family = "counters";

  ~ShortenedUrlsDatabase();
  ShortenedUrlsDatabase(const ShortenedUrlsDatabase &) = delete;
  ShortenedUrlsDatabase &operator=(const ShortenedUrlsDatabase &) = delete;

  // Throws `std::runtime_error` if RocksDB cannot open or create the database.
  [[nodiscard]] static auto open(const std::filesystem::path &path)
      -> std::shared_ptr<ShortenedUrlsDatabase>;

  // Inserts a new mapping. An existing token keeps its URL and the call
  // returns `TokenStoreError::AlreadyExists`.
  auto put(std::string_view token, std::string_view long_url) noexcept
      -> std::variant<std::monostate, TokenStoreError>;
  auto get(std::string_view token) noexcept
      -> std::variant<std::string, TokenStoreError>;

  // Adds one to counter `name` and returns the new value. A counter that does
  // not exist yet starts at `first_value`. The write is synced before the
  // value is returned. Returns `TokenStoreError::InternalRocksDbError` instead
  // of wrapping past the 64-bit maximum.
  auto increment_counter(std::string_view name,
                         std::uint64_t first_value) noexcept
      -> std::variant<std::uint64_t, TokenStoreError>;

  auto path() const noexcept -> const std::filesystem::path & { return path_; }
};
} // namespace db
} // namespace linkmint

#endif // _INCLUDE_LINKMINT_DB_H
