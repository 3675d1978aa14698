#include "stats_reporter.h"

#include "gtest/gtest.h"

namespace slotopt {
namespace {

TEST(StatsReporterTest, CountsByPatternStartTimeAndSlot) {
  const SlotCatalog cat = SlotCatalog::reference();
  // s1 s1 s2 s3 s5 s8 s10
  const ScheduleStats st = compute_stats(cat, {0, 0, 1, 2, 4, 7, 9}, 2);

  ASSERT_EQ(st.pattern_counts.size(), 2u);
  EXPECT_EQ(st.pattern_counts[0], std::make_pair(std::string("M/W/F"), 4));
  EXPECT_EQ(st.pattern_counts[1], std::make_pair(std::string("T/TH"), 3));

  ASSERT_EQ(st.start_time_counts.size(), 5u);
  EXPECT_EQ(st.start_time_counts[0], std::make_pair(std::string("9:00"), 3));
  EXPECT_EQ(st.start_time_counts[1].second, 1);
  EXPECT_EQ(st.start_time_counts[2].second, 1);
  EXPECT_EQ(st.start_time_counts[3].second, 1);
  EXPECT_EQ(st.start_time_counts[4], std::make_pair(std::string("3:00"), 1));

  EXPECT_EQ(st.slot_counts, (std::vector<int>{2, 1, 1, 0, 1, 0, 0, 1, 0, 1}));
  EXPECT_EQ(st.balance_diff, 1);
  EXPECT_EQ(st.time_diff, 2);
  EXPECT_TRUE(st.balance_ok);
  EXPECT_TRUE(st.time_ok);
}

TEST(StatsReporterTest, FlagsSpreadAboveLimit) {
  const SlotCatalog cat = SlotCatalog::reference();
  const ScheduleStats st = compute_stats(cat, {0, 0, 0, 0, 2}, 2);
  EXPECT_EQ(st.balance_diff, 5);
  EXPECT_EQ(st.time_diff, 4);
  EXPECT_FALSE(st.balance_ok);
  EXPECT_FALSE(st.time_ok);

  const ScheduleStats strict = compute_stats(cat, {0, 1}, 0);
  EXPECT_EQ(strict.balance_diff, 0);
  EXPECT_TRUE(strict.balance_ok);
  EXPECT_EQ(strict.time_diff, 2);
  EXPECT_FALSE(strict.time_ok);
}

TEST(StatsReporterTest, EmptyScheduleIsBalanced) {
  const ScheduleStats st = compute_stats(SlotCatalog::reference(), {}, 2);
  EXPECT_EQ(st.slot_counts, std::vector<int>(10, 0));
  EXPECT_EQ(st.balance_diff, 0);
  EXPECT_EQ(st.time_diff, 0);
  EXPECT_TRUE(st.balance_ok);
  EXPECT_TRUE(st.time_ok);
}

}  // namespace
}  // namespace slotopt
