#include "slot_catalog.h"

#include "gtest/gtest.h"

namespace slotopt {
namespace {

TEST(SlotCatalogTest, ReferenceCatalogHasTenSlotsInTwoPatterns) {
  const SlotCatalog cat = SlotCatalog::reference();
  ASSERT_EQ(cat.size(), 10);
  EXPECT_EQ(cat.at(0).code, "s1");
  EXPECT_EQ(cat.at(0).label, "MWF 9:00-10:15");
  EXPECT_EQ(cat.at(9).code, "s10");
  EXPECT_EQ(cat.at(9).ordinal, 10);

  ASSERT_EQ(cat.day_patterns().size(), 2u);
  EXPECT_EQ(cat.day_patterns()[0], "M/W/F");
  EXPECT_EQ(cat.day_patterns()[1], "T/TH");
  EXPECT_EQ(cat.pattern_groups()[0], (std::vector<int>{0, 2, 4, 6, 8}));
  EXPECT_EQ(cat.pattern_groups()[1], (std::vector<int>{1, 3, 5, 7, 9}));

  ASSERT_EQ(cat.start_times().size(), 5u);
  EXPECT_EQ(cat.start_times().front(), "9:00");
  EXPECT_EQ(cat.start_times().back(), "3:00");
  EXPECT_EQ(cat.start_time_groups()[4], (std::vector<int>{8, 9}));

  ASSERT_TRUE(cat.has_exclusion_slot());
  EXPECT_EQ(cat.exclusion_index(), 9);
  EXPECT_EQ(cat.index_of("s4"), 3);
  EXPECT_EQ(cat.index_of("s11"), -1);
}

TEST(SlotCatalogTest, CustomCatalogFillsOrdinalAndLabel) {
  const SlotCatalog cat({{0, "a", "", "MW", "8:00", "9:15"},
                         {0, "b", "", "TR", "8:00", "9:15"},
                         {0, "c", "Late", "MW", "6:00", "7:15"}},
                        "");
  EXPECT_FALSE(cat.has_exclusion_slot());
  EXPECT_EQ(cat.exclusion_index(), -1);
  EXPECT_EQ(cat.at(1).ordinal, 2);
  EXPECT_EQ(cat.at(0).label, "MW 8:00-9:15");
  EXPECT_EQ(cat.at(2).label, "Late");
  EXPECT_EQ(cat.start_times(), (std::vector<std::string>{"8:00", "6:00"}));
  EXPECT_EQ(cat.start_time_groups()[0], (std::vector<int>{0, 1}));
}

TEST(SlotCatalogTest, RejectsBrokenCatalogs) {
  EXPECT_THROW(SlotCatalog({}, ""), MalformedInput);
  EXPECT_THROW(SlotCatalog({{0, "a", "", "MW", "8:00", ""}, {0, "a", "", "TR", "8:00", ""}}, ""),
               MalformedInput);
  EXPECT_THROW(SlotCatalog({{0, "", "", "MW", "8:00", ""}}, ""), MalformedInput);
  EXPECT_THROW(SlotCatalog({{0, "a", "", "", "8:00", ""}}, ""), MalformedInput);
  EXPECT_THROW(SlotCatalog({{0, "a", "", "MW", "", ""}}, ""), MalformedInput);
  EXPECT_THROW(SlotCatalog({{0, "a", "", "MW", "8:00", ""}}, "z"), MalformedInput);
}

}  // namespace
}  // namespace slotopt
