#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <string>
#include <vector>

#include "streak.hpp"

using ht::HabitErrc;
using ht::longest_streak;

namespace {

int Streak(const std::vector<std::string>& dates) {
  auto r = longest_streak(dates);
  EXPECT_TRUE(r.ok()) << r.message();
  return r.ok() ? *r : -1;
}

}  // namespace

TEST(Streak, EmptyAndSingle) {
  EXPECT_EQ(Streak({}), 0);
  EXPECT_EQ(Streak({"2025-01-01"}), 1);
}

TEST(Streak, PicksLongestRun) {
  EXPECT_EQ(Streak({"2025-01-01", "2025-01-02", "2025-01-03", "2025-02-01"}), 3);
  EXPECT_EQ(Streak({"2025-03-01", "2025-03-02", "2025-03-03", "2025-03-04",
                    "2025-03-05"}),
            5);
}

TEST(Streak, MixedRunsFromSampleHistory) {
  std::vector<std::string> days = {
      "2025-01-01", "2025-01-02", "2025-01-03", "2025-02-01", "2025-02-02",
      "2025-03-01", "2025-03-02", "2025-03-03", "2025-03-04", "2025-03-05",
      "2025-04-01", "2025-04-02", "2025-04-03", "2025-04-04"};
  EXPECT_EQ(Streak(days), 5);
}

TEST(Streak, InvariantUnderPermutationAndDuplicates) {
  std::vector<std::string> days = {"2025-01-01", "2025-01-02", "2025-01-03",
                                   "2025-02-01", "2025-02-02", "2025-02-03",
                                   "2025-02-04", "2025-05-10"};
  int base = Streak(days);
  EXPECT_EQ(base, 4);

  std::mt19937 rng(42);
  for (int i = 0; i < 10; ++i) {
    auto shuffled = days;
    std::shuffle(shuffled.begin(), shuffled.end(), rng);
    EXPECT_EQ(Streak(shuffled), base);
  }

  auto doubled = days;
  doubled.insert(doubled.end(), days.begin(), days.end());
  EXPECT_EQ(Streak(doubled), base);
}

TEST(Streak, CrossesMonthYearAndLeapDay) {
  EXPECT_EQ(Streak({"2024-12-30", "2024-12-31", "2025-01-01"}), 3);
  EXPECT_EQ(Streak({"2024-02-28", "2024-02-29", "2024-03-01"}), 3);
  EXPECT_EQ(Streak({"2025-02-28", "2025-03-01"}), 2);
}

TEST(Streak, GapOfOneDayBreaksRun) {
  EXPECT_EQ(Streak({"2025-01-01", "2025-01-03", "2025-01-05"}), 1);
}

TEST(Streak, RejectsUnparsableDates) {
  auto r = longest_streak({"not-a-date"});
  EXPECT_FALSE(r.ok());
  EXPECT_EQ(r.code(), HabitErrc::InvalidInput);

  auto mixed = longest_streak({"2025-01-01", "2025-02-30"});
  EXPECT_EQ(mixed.code(), HabitErrc::InvalidInput);
}
