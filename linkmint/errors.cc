#include "linkmint/errors.h"

namespace linkmint {

auto decode_error_name(DecodeError err) noexcept -> std::string_view {
  switch (err) {
  case DecodeError::Empty:
    return "empty token";
  case DecodeError::UnknownSymbol:
    return "symbol not in alphabet";
  case DecodeError::Overflow:
    return "value out of range";
  case DecodeError::BelowOffset:
    return "value below identifier offset";
  }
  return "unknown decode error";
}

} // namespace linkmint
