#include "linkmint/app_config.h"

#include <cstdlib>
#include <cstring>
#include <folly/Conv.h>
#include <folly/Format.h>
#include <folly/Range.h>
#include <glog/logging.h>
#include <openssl/crypto.h>
#include <string>
#include <yaml-cpp/yaml.h>

#include "linkmint/errors.h"

namespace linkmint {
namespace app_config {

namespace {

constexpr const char *env_prefix = "LINKMINT__";

auto getenv_nonempty(const char *name) -> const char * {
  std::string full = std::string{env_prefix} + name;
  const char *v = std::getenv(full.c_str());
  if (v == nullptr || std::strlen(v) == 0) {
    return nullptr;
  }
  return v;
}

template <typename T>
auto parse_number(std::string_view what, std::string_view text) -> T {
  auto r = folly::tryTo<T>(folly::StringPiece{text});
  if (!r) {
    throw ConfigurationError{
        folly::sformat("\"{}\" is not a valid value for {}",
                       folly::StringPiece{text}, folly::StringPiece{what})};
  }
  return *r;
}

auto can_write_to_dir(const std::filesystem::path &directory) -> bool {
  try {
    std::filesystem::file_status status = std::filesystem::status(directory);
    return std::filesystem::exists(status) &&
           std::filesystem::is_directory(status) &&
           (status.permissions() & std::filesystem::perms::owner_write) !=
               std::filesystem::perms::none;
  } catch (const std::filesystem::filesystem_error &e) {
    LOG(ERROR) << "Error checking directory permissions: " << e.what();
  }
  return false;
}

} // namespace

auto parse_allocator_kind(std::string_view name) -> AllocatorKind {
  if (name == "rocksdb") {
    return AllocatorKind::RocksDb;
  }
  if (name == "memory") {
    return AllocatorKind::Memory;
  }
  throw ConfigurationError{folly::sformat(
      "unknown allocator \"{}\"; expected \"rocksdb\" or \"memory\"",
      folly::StringPiece{name})};
}

void ReadOnlyAppConfig::ReadOnlyAppConfigDeleter::operator()(
    ReadOnlyAppConfig *that) noexcept {
  if (that == nullptr) {
    return;
  }
  if (!that->secret_key.empty()) {
    OPENSSL_cleanse(that->secret_key.data(), that->secret_key.size());
  }
  delete that;
}

void ReadOnlyAppConfig::validate() const {
  if (secret_key.empty()) {
    throw ConfigurationError{"secret key must not be empty"};
  }
  // throws on duplicates or fewer than two symbols
  (void)token::Alphabet::create(alphabet);
  if (urls_db_path.empty()) {
    throw ConfigurationError{"token store path (urls_db_path) is not set"};
  }
  auto parent = std::filesystem::absolute(urls_db_path).parent_path();
  if (!can_write_to_dir(parent)) {
    throw ConfigurationError{folly::sformat(
        "cannot write to directory \"{}\" for the token store",
        parent.string())};
  }
  LOG_IF(WARNING, allocator == AllocatorKind::Memory)
      << "Using an in-process identifier counter. Identifiers restart at "
      << first_identifier << " on every run and collide with tokens already "
      << "stored; use it for a throwaway token store only.";
}

auto ReadOnlyAppConfig::new_from_yaml(std::filesystem::path yaml_filename)
    -> Ptr {
  Ptr dst{new ReadOnlyAppConfig, ReadOnlyAppConfigDeleter{}};

  YAML::Node config;
  try {
    config = YAML::LoadFile(yaml_filename.string());
  } catch (const YAML::Exception &e) {
    throw ConfigurationError{folly::sformat(
        "cannot load \"{}\": {}", yaml_filename.string(), e.what())};
  }

  try {
    if (!config["secret_key"]) {
      throw ConfigurationError{"missing \"secret_key\""};
    }
    dst->secret_key = config["secret_key"].as<std::string>();
    if (config["alphabet"]) {
      dst->alphabet = config["alphabet"].as<std::string>();
    }
    if (config["id_offset"]) {
      dst->id_offset = config["id_offset"].as<uint64_t>();
    }
    if (config["min_token_length"]) {
      // as<uint8_t> would read a character, not a number
      auto len = config["min_token_length"].as<unsigned>();
      if (len > 64) {
        throw ConfigurationError{"\"min_token_length\" must be at most 64"};
      }
      dst->min_token_length = static_cast<uint8_t>(len);
    }
    if (config["allocator"]) {
      dst->allocator =
          parse_allocator_kind(config["allocator"].as<std::string>());
    }
    if (config["first_identifier"]) {
      dst->first_identifier = config["first_identifier"].as<uint64_t>();
    }
    if (config["urls_db_path"]) {
      dst->urls_db_path = config["urls_db_path"].as<std::string>();
    }
    if (config["public_base_url"]) {
      dst->public_base_url = config["public_base_url"].as<std::string>();
    }
  } catch (const YAML::Exception &e) {
    throw ConfigurationError{folly::sformat(
        "invalid entry in \"{}\": {}", yaml_filename.string(), e.what())};
  }

  dst->validate();
  return dst;
}

auto ReadOnlyAppConfig::new_from_env() -> Ptr {
  Ptr dst{new ReadOnlyAppConfig, ReadOnlyAppConfigDeleter{}};

  const char *secret_key_inp = getenv_nonempty("SECRET_KEY");
  if (secret_key_inp == nullptr) {
    throw ConfigurationError{
        "Missing environment variable LINKMINT__SECRET_KEY"};
  }
  dst->secret_key.assign(secret_key_inp);

  if (const char *v = getenv_nonempty("ALPHABET")) {
    dst->alphabet.assign(v);
  }
  if (const char *v = getenv_nonempty("ID_OFFSET")) {
    dst->id_offset = parse_number<uint64_t>("LINKMINT__ID_OFFSET", v);
  }
  if (const char *v = getenv_nonempty("MIN_TOKEN_LENGTH")) {
    auto len = parse_number<unsigned>("LINKMINT__MIN_TOKEN_LENGTH", v);
    if (len > 64) {
      throw ConfigurationError{"LINKMINT__MIN_TOKEN_LENGTH must be at most 64"};
    }
    dst->min_token_length = static_cast<uint8_t>(len);
  }
  if (const char *v = getenv_nonempty("ALLOCATOR")) {
    dst->allocator = parse_allocator_kind(v);
  }
  if (const char *v = getenv_nonempty("FIRST_IDENTIFIER")) {
    dst->first_identifier =
        parse_number<uint64_t>("LINKMINT__FIRST_IDENTIFIER", v);
  }
  if (const char *v = getenv_nonempty("URLS_DB_PATH")) {
    dst->urls_db_path = std::filesystem::path{v};
  }
  if (const char *v = getenv_nonempty("PUBLIC_BASE_URL")) {
    dst->public_base_url.assign(v);
  }
  VLOG(3) << "loaded configuration from environment; alphabet of "
          << dst->alphabet.size() << " symbols, id offset " << dst->id_offset;

  dst->validate();
  return dst;
}

} // namespace app_config
} // namespace linkmint
