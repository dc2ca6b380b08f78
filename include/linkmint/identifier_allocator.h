#ifndef _INCLUDE_LINKMINT_IDENTIFIER_ALLOCATOR_H
#define _INCLUDE_LINKMINT_IDENTIFIER_ALLOCATOR_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace linkmint {
namespace db {
class ShortenedUrlsDatabase;
} // namespace db

namespace token {

// Source of identifiers. Every call, from any thread or any process sharing
// the same backing counter, must return a value strictly greater than every
// value returned before it. Implementations throw `AllocationError` instead
// of repeating or lowering a value.
class IdentifierAllocator {
public:
  virtual ~IdentifierAllocator() = default;
  virtual auto allocate() -> std::uint64_t = 0;
};

// Process-local counter for single-instance deployments.
class AtomicIdentifierAllocator : public IdentifierAllocator {
public:
  explicit AtomicIdentifierAllocator(std::uint64_t first_value = 1)
      : next_(first_value) {}

  auto allocate() -> std::uint64_t override;

private:
  std::atomic<std::uint64_t> next_;
};

// Durable counter kept in the URL database, so identifiers survive restarts.
// Only one process may have the database open at a time, which is what makes
// the counter global.
class RocksDbIdentifierAllocator : public IdentifierAllocator {
public:
  static constexpr const char *default_counter_name = "url_id";

  RocksDbIdentifierAllocator(std::shared_ptr<db::ShortenedUrlsDatabase> db,
                             std::uint64_t first_value = 1,
                             std::string counter_name = default_counter_name);

  auto allocate() -> std::uint64_t override;

private:
  std::shared_ptr<db::ShortenedUrlsDatabase> db_;
  const std::uint64_t first_value_;
  const std::string counter_name_;
};

} // namespace token
} // namespace linkmint

#endif // _INCLUDE_LINKMINT_IDENTIFIER_ALLOCATOR_H
