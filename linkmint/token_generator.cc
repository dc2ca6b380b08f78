#include "linkmint/token_generator.h"

#include <folly/Format.h>
#include <glog/logging.h>
#include <limits>

#include "linkmint/identifier_encoder.h"

namespace linkmint {
namespace token {

auto apply_offset(std::uint64_t id, std::uint64_t offset) -> std::uint64_t {
  if (id > std::numeric_limits<std::uint64_t>::max() - offset) {
    throw AllocationError{folly::sformat(
        "identifier {} overflows when offset by {}", id, offset)};
  }
  return id + offset;
}

auto remove_offset(std::uint64_t value, std::uint64_t offset)
    -> folly::Expected<std::uint64_t, DecodeError> {
  if (value < offset) {
    return folly::makeUnexpected(DecodeError::BelowOffset);
  }
  return value - offset;
}

TokenGenerator::TokenGenerator(std::shared_ptr<IdentifierAllocator> allocator,
                               Alphabet permuted_alphabet,
                               TokenGeneratorOptions options)
    : allocator_(std::move(allocator)),
      alphabet_(std::move(permuted_alphabet)), options_(options) {
  if (!allocator_) {
    throw ConfigurationError{"token generator needs an identifier allocator"};
  }
  if (options_.min_token_length > 0) {
    auto shortest = encoded_length(options_.id_offset, alphabet_.size());
    if (shortest < options_.min_token_length) {
      throw ConfigurationError{folly::sformat(
          "id offset {} gives {}-symbol tokens, below the minimum of {}; use "
          "an offset of at least {}",
          options_.id_offset, shortest, options_.min_token_length,
          offset_for(alphabet_, options_.min_token_length))};
    }
  }
}

auto TokenGenerator::offset_for(const Alphabet &alphabet,
                                std::uint8_t min_token_length)
    -> std::uint64_t {
  return minimum_offset_for_length(alphabet.size(), min_token_length);
}

auto TokenGenerator::next() -> std::string {
  const std::uint64_t id = allocator_->allocate();

  LastIssued &last = *last_issued_;
  if (last.seen && id <= last.id) {
    LOG(ERROR) << "identifier allocator went backwards: issued " << id
               << " after " << last.id;
    throw AllocationError{folly::sformat(
        "allocator issued {} after {}; identifiers must strictly increase", id,
        last.id)};
  }
  last.seen = true;
  last.id = id;

  return encode(apply_offset(id, options_.id_offset), alphabet_);
}

auto TokenGenerator::decode(std::string_view token) const
    -> folly::Expected<std::uint64_t, DecodeError> {
  auto value = ::linkmint::token::decode(token, alphabet_);
  if (value.hasError()) {
    return value;
  }
  return remove_offset(value.value(), options_.id_offset);
}

} // namespace token
} // namespace linkmint
