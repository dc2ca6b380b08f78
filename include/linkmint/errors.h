#ifndef _INCLUDE_LINKMINT_ERRORS_H
#define _INCLUDE_LINKMINT_ERRORS_H

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace linkmint {

// Raised while building the token generation pipeline from operator input:
// empty secret key, duplicate alphabet symbols, alphabet of fewer than two
// symbols, inconsistent offset/minimum-length settings.
class ConfigurationError : public std::invalid_argument {
public:
  explicit ConfigurationError(const std::string &what)
      : std::invalid_argument(what) {}
};

// Raised when the identifier source is unavailable or hands out a value that
// is not strictly greater than one it issued before. Fatal for the current
// request; never retried here.
class AllocationError : public std::runtime_error {
public:
  explicit AllocationError(const std::string &what)
      : std::runtime_error(what) {}
};

enum class DecodeError {
  Empty,
  UnknownSymbol,
  Overflow,
  // decodes to a value below the generator's identifier offset
  BelowOffset,
};

auto decode_error_name(DecodeError err) noexcept -> std::string_view;

} // namespace linkmint

#endif // _INCLUDE_LINKMINT_ERRORS_H
