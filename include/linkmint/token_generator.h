#ifndef _INCLUDE_LINKMINT_TOKEN_GENERATOR_H
#define _INCLUDE_LINKMINT_TOKEN_GENERATOR_H

#include <cstdint>
#include <folly/Expected.h>
#include <folly/ThreadLocal.h>
#include <memory>
#include <string>
#include <string_view>

#include "linkmint/alphabet.h"
#include "linkmint/errors.h"
#include "linkmint/identifier_allocator.h"

namespace linkmint {
namespace token {

struct TokenGeneratorOptions {
  // Added to every allocated identifier before encoding.
  std::uint64_t id_offset{0};
  // When non-zero, `id_offset` must make identifier 0 encode to at least this
  // many symbols.
  std::uint8_t min_token_length{0};
};

// `id + offset`. Throws `AllocationError` if the sum does not fit in 64 bits.
auto apply_offset(std::uint64_t id, std::uint64_t offset) -> std::uint64_t;

// Inverse of `apply_offset`; values below `offset` are
// `DecodeError::BelowOffset`.
auto remove_offset(std::uint64_t value, std::uint64_t offset)
    -> folly::Expected<std::uint64_t, DecodeError>;

// Turns allocator identifiers into tokens written with a permuted alphabet.
// `next()` may be called from any number of threads; uniqueness comes from
// the allocator.
class TokenGenerator {
public:
  // Throws `ConfigurationError` if the options cannot be satisfied.
  TokenGenerator(std::shared_ptr<IdentifierAllocator> allocator,
                 Alphabet permuted_alphabet, TokenGeneratorOptions options);

  // Consumes exactly one identifier. Throws `AllocationError` if the
  // allocator fails, if the offset identifier overflows, or if the allocator
  // hands this thread a value not greater than the last one it handed this
  // thread.
  auto next() -> std::string;

  // Raw allocator identifier a token was generated from.
  auto decode(std::string_view token) const
      -> folly::Expected<std::uint64_t, DecodeError>;

  auto alphabet() const noexcept -> const Alphabet & { return alphabet_; }
  auto options() const noexcept -> const TokenGeneratorOptions & {
    return options_;
  }

  // Smallest offset that makes every token at least `min_token_length` long.
  static auto offset_for(const Alphabet &alphabet,
                         std::uint8_t min_token_length) -> std::uint64_t;

private:
  struct LastIssued {
    bool seen{false};
    std::uint64_t id{0};
  };

  std::shared_ptr<IdentifierAllocator> allocator_;
  const Alphabet alphabet_;
  const TokenGeneratorOptions options_;
  folly::ThreadLocal<LastIssued> last_issued_;
};

} // namespace token
} // namespace linkmint

#endif // _INCLUDE_LINKMINT_TOKEN_GENERATOR_H
