#include "satisfaction.h"

#include "gtest/gtest.h"

namespace slotopt {
namespace {

TEST(SatisfactionTest, UnrankedSlotsScoreZero) {
  SatisfactionModel m(4, 0.1, 1.0, 1);
  for (double pop : {0.0, 0.3, 1.0}) EXPECT_EQ(m.score(0, pop), 0.0);
}

TEST(SatisfactionTest, ScoreStaysInsideNoiseBand) {
  SatisfactionModel m(4, 0.1, 1.0, 99);
  for (int i = 0; i < 200; ++i) {
    const double v = m.score(1, 0.5);
    EXPECT_GE(v, 4.0 - 0.5 + 0.1);
    EXPECT_LE(v, 4.0 - 0.5 + 1.0);
  }
}

TEST(SatisfactionTest, BetterRankAlwaysScoresHigherAtEqualPopularity) {
  SatisfactionModel m(4, 0.1, 1.0, 3);
  for (int i = 0; i < 200; ++i) {
    const double pop = (i % 11) / 10.0;
    EXPECT_GT(m.score(1, pop), m.score(2, pop));
    EXPECT_GT(m.score(3, pop), m.score(4, pop));
  }
}

TEST(SatisfactionTest, RanksBeyondScaleClampToZero) {
  SatisfactionModel m(4, 0.1, 1.0, 5);
  for (int i = 0; i < 50; ++i) EXPECT_EQ(m.score(7, 0.0), 0.0);
}

TEST(SatisfactionTest, RankJustPastScaleKeepsOnlyNoiseMinusPopularity) {
  SatisfactionModel m(4, 0.1, 1.0, 12345);
  for (int i = 0; i < 100; ++i) {
    const double v = m.score(5, 0.25);
    EXPECT_GE(v, 0.0);
    EXPECT_LT(v, 1.0 - 0.25);
  }
}

TEST(SatisfactionTest, MatrixFollowsPreferenceShape) {
  const PreferenceTable prefs = {{"A", {1, 0, 2}}, {"B", {0, 0, 0}}};
  SatisfactionModel m(4, 0.1, 1.0, 11);
  const SatisfactionMatrix sat = m.build_matrix(prefs, {1.0, 0.5, 0.0});
  ASSERT_EQ(sat.size(), 2u);
  ASSERT_EQ(sat[0].size(), 3u);
  EXPECT_GT(sat[0][0], 0.0);
  EXPECT_EQ(sat[0][1], 0.0);
  EXPECT_GT(sat[0][2], 0.0);
  EXPECT_EQ(sat[1], (std::vector<double>{0.0, 0.0, 0.0}));
  for (const auto& row : sat)
    for (double v : row) EXPECT_GE(v, 0.0);
}

TEST(SatisfactionTest, SameSeedSameMatrix) {
  const PreferenceTable prefs = {{"A", {1, 2, 3, 4}}, {"B", {4, 3, 2, 1}}, {"C", {2, 0, 1, 0}}};
  const std::vector<double> pop = {0.2, 0.4, 0.6, 0.8};
  SatisfactionModel a(4, 0.1, 1.0, 2024);
  SatisfactionModel b(4, 0.1, 1.0, 2024);
  SatisfactionModel c(4, 0.1, 1.0, 2025);
  const SatisfactionMatrix ma = a.build_matrix(prefs, pop);
  EXPECT_EQ(ma, b.build_matrix(prefs, pop));
  EXPECT_NE(ma, c.build_matrix(prefs, pop));
}

}  // namespace
}  // namespace slotopt
