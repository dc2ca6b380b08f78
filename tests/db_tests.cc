#include <gtest/gtest.h>

#include <limits>
#include <set>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "linkmint/db.h"
#include "linkmint/errors.h"
#include "linkmint/identifier_allocator.h"
#include "test_util.h"

using linkmint::db::ShortenedUrlsDatabase;
using linkmint::db::TokenStoreError;
using linkmint::testing::TempDir;

TEST(ShortenedUrlsDatabase, PutThenGet) {
  TempDir dir;
  auto db = ShortenedUrlsDatabase::open(dir.path() / "urls");
  auto put = db->put("1trI", "https://example.com/a/long/path");
  EXPECT_TRUE(std::holds_alternative<std::monostate>(put));
  auto got = db->get("1trI");
  ASSERT_TRUE(std::holds_alternative<std::string>(got));
  EXPECT_EQ(std::get<std::string>(got), "https://example.com/a/long/path");
}

TEST(ShortenedUrlsDatabase, MissingTokenIsNotFound) {
  TempDir dir;
  auto db = ShortenedUrlsDatabase::open(dir.path() / "urls");
  auto got = db->get("nope");
  ASSERT_TRUE(std::holds_alternative<TokenStoreError>(got));
  EXPECT_EQ(std::get<TokenStoreError>(got), TokenStoreError::NotFound);
}

TEST(ShortenedUrlsDatabase, MappingsSurviveReopen) {
  TempDir dir;
  {
    auto db = ShortenedUrlsDatabase::open(dir.path() / "urls");
    EXPECT_TRUE(std::holds_alternative<std::monostate>(
        db->put("abc", "https://example.org/")));
  }
  auto db = ShortenedUrlsDatabase::open(dir.path() / "urls");
  auto got = db->get("abc");
  ASSERT_TRUE(std::holds_alternative<std::string>(got));
  EXPECT_EQ(std::get<std::string>(got), "https://example.org/");
}

TEST(ShortenedUrlsDatabase, PutNeverReplacesAMapping) {
  TempDir dir;
  auto db = ShortenedUrlsDatabase::open(dir.path() / "urls");
  EXPECT_TRUE(std::holds_alternative<std::monostate>(
      db->put("1trI", "https://example.com/first")));
  auto again = db->put("1trI", "https://example.com/second");
  ASSERT_TRUE(std::holds_alternative<TokenStoreError>(again));
  EXPECT_EQ(std::get<TokenStoreError>(again), TokenStoreError::AlreadyExists);

  auto got = db->get("1trI");
  ASSERT_TRUE(std::holds_alternative<std::string>(got));
  EXPECT_EQ(std::get<std::string>(got), "https://example.com/first");
}

TEST(ShortenedUrlsDatabase, CountersAreSeparateFromTokens) {
  TempDir dir;
  auto db = ShortenedUrlsDatabase::open(dir.path() / "urls");
  auto v = db->increment_counter("url_id", 1);
  ASSERT_TRUE(std::holds_alternative<std::uint64_t>(v));
  auto got = db->get("url_id");
  ASSERT_TRUE(std::holds_alternative<TokenStoreError>(got));
  EXPECT_EQ(std::get<TokenStoreError>(got), TokenStoreError::NotFound);
}

TEST(ShortenedUrlsDatabase, CounterStartsAtFirstValueAndIncrements) {
  TempDir dir;
  auto db = ShortenedUrlsDatabase::open(dir.path() / "urls");
  EXPECT_EQ(std::get<std::uint64_t>(db->increment_counter("c", 100)), 100u);
  EXPECT_EQ(std::get<std::uint64_t>(db->increment_counter("c", 100)), 101u);
  // first_value only matters for a fresh counter
  EXPECT_EQ(std::get<std::uint64_t>(db->increment_counter("c", 1)), 102u);
  EXPECT_EQ(std::get<std::uint64_t>(db->increment_counter("other", 1)), 1u);
}

TEST(ShortenedUrlsDatabase, ErrorNames) {
  EXPECT_EQ(linkmint::db::token_store_error_name(TokenStoreError::NotFound),
            "not found");
  EXPECT_EQ(linkmint::db::token_store_error_name(TokenStoreError::IOError),
            "I/O error");
  EXPECT_EQ(
      linkmint::db::token_store_error_name(TokenStoreError::AlreadyExists),
      "token already exists");
}

TEST(RocksDbIdentifierAllocator, ContinuesAfterRestart) {
  TempDir dir;
  {
    auto db = ShortenedUrlsDatabase::open(dir.path() / "urls");
    linkmint::token::RocksDbIdentifierAllocator alloc{db, 1};
    EXPECT_EQ(alloc.allocate(), 1u);
    EXPECT_EQ(alloc.allocate(), 2u);
  }
  auto db = ShortenedUrlsDatabase::open(dir.path() / "urls");
  linkmint::token::RocksDbIdentifierAllocator alloc{db, 1};
  EXPECT_EQ(alloc.allocate(), 3u);
}

TEST(RocksDbIdentifierAllocator, ConcurrentAllocationsAreUnique) {
  TempDir dir;
  auto db = ShortenedUrlsDatabase::open(dir.path() / "urls");
  linkmint::token::RocksDbIdentifierAllocator alloc{db};
  constexpr int kThreads = 4;
  constexpr int kPerThread = 50;
  std::vector<std::vector<std::uint64_t>> got(kThreads);
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        got[t].push_back(alloc.allocate());
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  std::set<std::uint64_t> all;
  for (const auto &ids : got) {
    for (std::size_t i = 1; i < ids.size(); ++i) {
      EXPECT_LT(ids[i - 1], ids[i]);
    }
    all.insert(ids.begin(), ids.end());
  }
  EXPECT_EQ(all.size(), static_cast<std::size_t>(kThreads * kPerThread));
  EXPECT_EQ(*all.begin(), 1u);
  EXPECT_EQ(*all.rbegin(), static_cast<std::uint64_t>(kThreads * kPerThread));
}

TEST(RocksDbIdentifierAllocator, ExhaustedCounterIsAllocationError) {
  TempDir dir;
  auto db = ShortenedUrlsDatabase::open(dir.path() / "urls");
  linkmint::token::RocksDbIdentifierAllocator alloc{
      db, std::numeric_limits<std::uint64_t>::max()};
  EXPECT_EQ(alloc.allocate(), std::numeric_limits<std::uint64_t>::max());
  EXPECT_THROW(alloc.allocate(), linkmint::AllocationError);
}
