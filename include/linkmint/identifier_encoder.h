#ifndef _INCLUDE_LINKMINT_IDENTIFIER_ENCODER_H
#define _INCLUDE_LINKMINT_IDENTIFIER_ENCODER_H

#include <cstdint>
#include <folly/Expected.h>
#include <string>
#include <string_view>

#include "linkmint/alphabet.h"
#include "linkmint/errors.h"

namespace linkmint {
namespace token {

// Positional base-N numeral conversion, N being the alphabet size. Tokens are
// written most significant digit first. Identifier 0 is the alphabet's first
// symbol, so a token is never empty.
auto encode(std::uint64_t id, const Alphabet &alphabet) -> std::string;

// Inverse of `encode` under the same alphabet. A symbol the alphabet does not
// contain is an error, never skipped or mapped to a nearby value.
auto decode(std::string_view token, const Alphabet &alphabet)
    -> folly::Expected<std::uint64_t, DecodeError>;

// Number of symbols `encode(id, A)` produces when A has `base` symbols.
auto encoded_length(std::uint64_t id, std::size_t base) noexcept
    -> std::size_t;

// Smallest identifier whose encoding has at least `length` symbols, i.e.
// base^(length - 1). Throws `ConfigurationError` if that does not fit in 64
// bits.
auto minimum_offset_for_length(std::size_t base, std::size_t length)
    -> std::uint64_t;

} // namespace token
} // namespace linkmint

#endif // _INCLUDE_LINKMINT_IDENTIFIER_ENCODER_H
