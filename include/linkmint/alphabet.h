#ifndef _INCLUDE_LINKMINT_ALPHABET_H
#define _INCLUDE_LINKMINT_ALPHABET_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace linkmint {
namespace token {

// Digit set of the numeral system tokens are written in.
constexpr std::string_view default_alphabet =
    "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

// An ordered, duplicate-free set of single-byte symbols. The position of a
// symbol is its digit value. Immutable once created, so one instance may be
// shared by any number of threads.
class Alphabet {
public:
  // Throws `ConfigurationError` if `symbols` has fewer than 2 entries or
  // repeats a symbol.
  [[nodiscard]] static auto create(std::string_view symbols) -> Alphabet;

  auto size() const noexcept -> std::size_t { return symbols_.size(); }
  auto symbols() const noexcept -> std::string_view { return symbols_; }
  auto at(std::size_t position) const -> char { return symbols_.at(position); }
  auto position_of(char symbol) const noexcept -> std::optional<std::size_t>;
  auto contains(char symbol) const noexcept -> bool {
    return position_of(symbol).has_value();
  }

  friend auto operator==(const Alphabet &a, const Alphabet &b) noexcept
      -> bool {
    return a.symbols_ == b.symbols_;
  }

private:
  static constexpr std::int16_t absent = -1;

  explicit Alphabet(std::string symbols);

  std::string symbols_;
  std::array<std::int16_t, 256> positions_;
};

} // namespace token
} // namespace linkmint

#endif // _INCLUDE_LINKMINT_ALPHABET_H
