// =============================================================================
// fill_filter_test.cpp
// =============================================================================
// Unit tests for copytrader::FillFilter.
//
// Validates:
//   - Duplicate hashes are dropped, within and across batches
//   - Below-threshold fills are dropped and not remembered
//   - The per-batch cap defers the remainder without remembering it
//   - Hashes outside the dedup window are forgotten
// =============================================================================

#include "copytrader/ingest/fill_filter.hpp"

#include <gtest/gtest.h>

using copytrader::FillFilter;
using copytrader::domain::Fill;
using copytrader::domain::Side;

static Fill makeFill(const std::string& hash, double size, double price,
                     std::int64_t time_ms = 0) {
  Fill fill;
  fill.coin = "BTC";
  fill.side = Side::Buy;
  fill.size = size;
  fill.price = price;
  fill.hash = hash;
  fill.time_ms = time_ms;
  return fill;
}

TEST(FillFilterTest, DropsDuplicateHashes) {
  FillFilter filter(0.0, 50, 7200000);

  auto first = filter.filter({makeFill("h1", 1, 100), makeFill("h1", 1, 100),
                              makeFill("h2", 1, 100)});
  ASSERT_EQ(first.size(), 2u);
  EXPECT_EQ(first[0].hash, "h1");
  EXPECT_EQ(first[1].hash, "h2");

  auto second = filter.filter({makeFill("h2", 1, 100), makeFill("h3", 1, 100)});
  ASSERT_EQ(second.size(), 1u);
  EXPECT_EQ(second[0].hash, "h3");
  EXPECT_EQ(filter.seenCount(), 3u);
}

TEST(FillFilterTest, BelowThresholdIsDroppedButNotRemembered) {
  FillFilter filter(1000.0, 50, 7200000);

  EXPECT_TRUE(filter.filter({makeFill("small", 1, 999)}).empty());
  EXPECT_EQ(filter.seenCount(), 0u);

  // The threshold is inclusive.
  EXPECT_EQ(filter.filter({makeFill("edge", 1, 1000)}).size(), 1u);
}

TEST(FillFilterTest, BatchCapDefersTheRest) {
  FillFilter filter(0.0, 2, 7200000);

  auto first = filter.filter({makeFill("a", 1, 10), makeFill("b", 1, 10),
                              makeFill("c", 1, 10)});
  ASSERT_EQ(first.size(), 2u);
  EXPECT_EQ(filter.seenCount(), 2u);

  // "c" was deferred, so a redelivery still passes.
  auto second = filter.filter({makeFill("a", 1, 10), makeFill("c", 1, 10)});
  ASSERT_EQ(second.size(), 1u);
  EXPECT_EQ(second[0].hash, "c");
}

TEST(FillFilterTest, ForgetsHashesOutsideWindow) {
  FillFilter filter(0.0, 50, 1000);

  filter.filter({makeFill("old", 1, 10, 0)});
  EXPECT_EQ(filter.seenCount(), 1u);

  filter.filter({makeFill("new", 1, 10, 5000)});
  EXPECT_EQ(filter.seenCount(), 1u);

  // "old" fell out of the window and is accepted again.
  EXPECT_EQ(filter.filter({makeFill("old", 1, 10, 5000)}).size(), 1u);
}

TEST(FillFilterTest, FillsWithoutHashAreAlwaysEligible) {
  FillFilter filter(0.0, 50, 7200000);
  EXPECT_EQ(filter.filter({makeFill("", 1, 10), makeFill("", 1, 10)}).size(),
            2u);
  EXPECT_EQ(filter.seenCount(), 0u);
}
