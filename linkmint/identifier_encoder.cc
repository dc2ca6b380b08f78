#include "linkmint/identifier_encoder.h"

#include <algorithm>
#include <folly/Format.h>
#include <limits>

namespace linkmint {
namespace token {

static constexpr std::size_t max_encoded_len = 64; // base 2, 64-bit id

auto encode(std::uint64_t id, const Alphabet &alphabet) -> std::string {
  const std::uint64_t base = alphabet.size();
  std::string out;
  out.reserve(max_encoded_len);
  do {
    out.push_back(alphabet.at(id % base));
    id /= base;
  } while (id > 0);
  std::reverse(out.begin(), out.end());
  return out;
}

auto decode(std::string_view token, const Alphabet &alphabet)
    -> folly::Expected<std::uint64_t, DecodeError> {
  if (token.empty()) {
    return folly::makeUnexpected(DecodeError::Empty);
  }
  constexpr auto max = std::numeric_limits<std::uint64_t>::max();
  const std::uint64_t base = alphabet.size();
  std::uint64_t value = 0;
  for (char c : token) {
    auto pos = alphabet.position_of(c);
    if (!pos) {
      return folly::makeUnexpected(DecodeError::UnknownSymbol);
    }
    // value * base + pos must not exceed max
    if (value > (max - *pos) / base) {
      return folly::makeUnexpected(DecodeError::Overflow);
    }
    value = value * base + *pos;
  }
  return value;
}

auto encoded_length(std::uint64_t id, std::size_t base) noexcept
    -> std::size_t {
  std::size_t len = 1;
  while (id >= base) {
    id /= base;
    ++len;
  }
  return len;
}

auto minimum_offset_for_length(std::size_t base, std::size_t length)
    -> std::uint64_t {
  if (base < 2) {
    throw ConfigurationError{"alphabet size must be at least 2"};
  }
  std::uint64_t offset = 1;
  for (std::size_t i = 1; i < length; ++i) {
    if (offset > std::numeric_limits<std::uint64_t>::max() / base) {
      throw ConfigurationError{folly::sformat(
          "minimum token length {} is unreachable with a {}-symbol alphabet",
          length, base)};
    }
    offset *= base;
  }
  return length == 0 ? 0 : offset;
}

} // namespace token
} // namespace linkmint
