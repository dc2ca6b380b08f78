#ifndef _INCLUDE_LINKMINT_APP_CONFIG_H
#define _INCLUDE_LINKMINT_APP_CONFIG_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "linkmint/alphabet.h"

namespace linkmint {
namespace app_config {

enum class AllocatorKind {
  // durable counter in the token store's RocksDB database
  RocksDb,
  // process-local counter; identifiers restart on every run
  Memory,
};

auto parse_allocator_kind(std::string_view name) -> AllocatorKind;

struct ReadOnlyAppConfig {
  // Operator secret from which the permuted alphabet is derived. Changing it
  // changes every token issued afterwards.
  std::string secret_key;

  std::string alphabet{token::default_alphabet};

  // Added to every identifier before encoding so that short tokens are never
  // handed out.
  uint64_t id_offset{14'000'000};

  // 0 disables the check that `id_offset` yields tokens at least this long.
  uint8_t min_token_length{0};

  AllocatorKind allocator{AllocatorKind::RocksDb};

  // Value handed out by a fresh counter.
  uint64_t first_identifier{1};

  std::filesystem::path urls_db_path;

  // This is the base URL for your URL shortening service, after which
  // the token is appended. For example, "https://s.example/".
  std::string public_base_url{"http://localhost:3000/"};

  // Wipes the secret key before freeing the config.
  struct ReadOnlyAppConfigDeleter {
    void operator()(ReadOnlyAppConfig *that) noexcept;
  };

  using Ptr = std::unique_ptr<ReadOnlyAppConfig, ReadOnlyAppConfigDeleter>;

  // All of these throw `ConfigurationError` on missing or invalid entries.
  [[nodiscard]] static auto new_from_env() -> Ptr;
  [[nodiscard]] static auto new_from_yaml(std::filesystem::path yaml_filename)
      -> Ptr;

  void validate() const;
};

} // namespace app_config
} // namespace linkmint

#endif // _INCLUDE_LINKMINT_APP_CONFIG_H
