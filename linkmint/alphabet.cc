#include "linkmint/alphabet.h"

#include <folly/Format.h>
#include <utility>

#include "linkmint/errors.h"

namespace linkmint {
namespace token {

namespace {
auto index_of(char c) -> std::size_t {
  return static_cast<unsigned char>(c);
}
} // namespace

Alphabet::Alphabet(std::string symbols) : symbols_(std::move(symbols)) {
  positions_.fill(absent);
  for (std::size_t i = 0; i < symbols_.size(); ++i) {
    positions_[index_of(symbols_[i])] = static_cast<std::int16_t>(i);
  }
}

auto Alphabet::create(std::string_view symbols) -> Alphabet {
  if (symbols.size() < 2) {
    throw ConfigurationError{folly::sformat(
        "alphabet must have at least 2 symbols, got {}", symbols.size())};
  }
  std::array<bool, 256> seen{};
  for (std::size_t i = 0; i < symbols.size(); ++i) {
    auto idx = index_of(symbols[i]);
    if (seen[idx]) {
      throw ConfigurationError{folly::sformat(
          "alphabet repeats symbol '{}' (at position {})", symbols[i], i)};
    }
    seen[idx] = true;
  }
  return Alphabet{std::string{symbols}};
}

auto Alphabet::position_of(char symbol) const noexcept
    -> std::optional<std::size_t> {
  auto pos = positions_[index_of(symbol)];
  if (pos == absent) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(pos);
}

} // namespace token
} // namespace linkmint
