#include "linkmint/identifier_allocator.h"

#include <folly/Format.h>
#include <folly/Range.h>
#include <glog/logging.h>
#include <limits>
#include <variant>

#include "linkmint/db.h"
#include "linkmint/errors.h"

namespace linkmint {
namespace token {

auto AtomicIdentifierAllocator::allocate() -> std::uint64_t {
  auto cur = next_.load(std::memory_order_relaxed);
  do {
    if (cur == std::numeric_limits<std::uint64_t>::max()) {
      throw AllocationError{"in-process identifier counter is exhausted"};
    }
  } while (!next_.compare_exchange_weak(cur, cur + 1,
                                        std::memory_order_relaxed));
  return cur;
}

RocksDbIdentifierAllocator::RocksDbIdentifierAllocator(
    std::shared_ptr<db::ShortenedUrlsDatabase> db, std::uint64_t first_value,
    std::string counter_name)
    : db_(std::move(db)), first_value_(first_value),
      counter_name_(std::move(counter_name)) {
  CHECK(db_) << "RocksDbIdentifierAllocator needs an open database";
}

auto RocksDbIdentifierAllocator::allocate() -> std::uint64_t {
  auto got = db_->increment_counter(counter_name_, first_value_);
  if (auto err = std::get_if<db::TokenStoreError>(&got)) {
    throw AllocationError{
        folly::sformat("counter \"{}\" unavailable: {}", counter_name_,
                       folly::StringPiece{db::token_store_error_name(*err)})};
  }
  return std::get<std::uint64_t>(got);
}

} // namespace token
} // namespace linkmint
