#include "assignment_solver.h"

#include <cmath>

#include "gtest/gtest.h"
#include "satisfaction.h"
#include "stats_reporter.h"
#include "test_helpers.h"

namespace slotopt {
namespace {

using testing_util::ScriptedBackend;
using testing_util::cbc;
using testing_util::course_name;

std::vector<std::string> course_list(int n) {
  std::vector<std::string> out;
  for (int c = 0; c < n; ++c) out.push_back(course_name(c));
  return out;
}

// Every course values only `slot`, at `value`.
SatisfactionMatrix single_slot_matrix(int courses, int slot, double value) {
  SatisfactionMatrix m(courses, std::vector<double>(10, 0.0));
  for (auto& row : m) row[slot] = value;
  return m;
}

AssignmentParams params_with(ExclusionPolicy policy) {
  AssignmentParams p;
  p.time_limit_ms = 60000;
  p.exclusion_policy = policy;
  return p;
}

int count_in(const AssignmentOutcome& out, int slot) {
  int n = 0;
  for (int s : out.slot_of_course) n += (s == slot);
  return n;
}

TEST(BalanceBoundsTest, DayPatternFloor) {
  EXPECT_EQ(day_pattern_floor(10, 2), 4);
  EXPECT_EQ(day_pattern_floor(7, 2), 3);
  EXPECT_EQ(day_pattern_floor(1, 2), 0);
  EXPECT_EQ(day_pattern_floor(0, 2), 0);
  EXPECT_EQ(day_pattern_floor(9, 3), 2);
}

TEST(BalanceBoundsTest, StartTimeBand) {
  EXPECT_EQ(start_time_band(10, 5), std::make_pair(2, 4));
  EXPECT_EQ(start_time_band(7, 5), std::make_pair(1, 3));
  EXPECT_EQ(start_time_band(3, 5), std::make_pair(0, 2));
  EXPECT_EQ(start_time_band(23, 5), std::make_pair(4, 6));
}

TEST(AssignmentSolverTest, PopularSlotIsCappedByStartTimeBand) {
  const int C = 10;
  const SlotCatalog cat = SlotCatalog::reference();
  const AssignmentOutcome out =
      solve_assignment(cat, course_list(C), single_slot_matrix(C, 0, 4.0), std::vector<bool>(C, false),
                       params_with(ExclusionPolicy::voting), cbc());
  ASSERT_EQ(out.failure, Failure::none) << out.message;
  ASSERT_EQ(out.entries.size(), 10u);
  // ten courses over five start times: exactly two per start time
  EXPECT_EQ(count_in(out, 0), 2);
  EXPECT_NEAR(out.satisfaction_total, 8.0, 1e-6);

  const ScheduleStats st = compute_stats(cat, out.slot_of_course, 2);
  for (const auto& kv : st.pattern_counts) EXPECT_GE(kv.second, 4) << kv.first;
  for (const auto& kv : st.start_time_counts) {
    EXPECT_EQ(kv.second, 2) << kv.first;
  }
  for (int c = 0; c < C; ++c) {
    EXPECT_EQ(out.entries[c].course, course_name(c));
    const bool in_s1 = out.slot_of_course[c] == 0;
    EXPECT_EQ(out.entries[c].satisfaction, in_s1 ? 4.0 : 0.0);
  }
}

TEST(AssignmentSolverTest, VotingCoursesStayOutOfExclusionSlot) {
  const int C = 5;
  const std::vector<bool> voting = {true, true, false, false, false};
  const AssignmentOutcome out =
      solve_assignment(SlotCatalog::reference(), course_list(C), single_slot_matrix(C, 9, 3.0), voting,
                       params_with(ExclusionPolicy::voting), cbc());
  ASSERT_EQ(out.failure, Failure::none) << out.message;
  EXPECT_NE(out.slot_of_course[0], 9);
  EXPECT_NE(out.slot_of_course[1], 9);
  // five courses over five start times: one course per start time
  EXPECT_EQ(count_in(out, 9), 1);
  EXPECT_NEAR(out.satisfaction_total, 3.0, 1e-6);
  EXPECT_TRUE(out.entries[2].slot_code == "s10" || out.entries[3].slot_code == "s10" ||
              out.entries[4].slot_code == "s10");
}

TEST(AssignmentSolverTest, AllPolicyBarsEveryCourse) {
  const int C = 5;
  const AssignmentOutcome out =
      solve_assignment(SlotCatalog::reference(), course_list(C), single_slot_matrix(C, 9, 3.0),
                       std::vector<bool>(C, false), params_with(ExclusionPolicy::all), cbc());
  ASSERT_EQ(out.failure, Failure::none) << out.message;
  EXPECT_EQ(count_in(out, 9), 0);
  EXPECT_NEAR(out.satisfaction_total, 0.0, 1e-6);
}

TEST(AssignmentSolverTest, OffPolicyAndNonVotingPoolMayUseExclusionSlot) {
  const SatisfactionMatrix sat = single_slot_matrix(1, 9, 3.0);

  const AssignmentOutcome off = solve_assignment(SlotCatalog::reference(), course_list(1), sat, {true},
                                                 params_with(ExclusionPolicy::off), cbc());
  ASSERT_EQ(off.failure, Failure::none) << off.message;
  EXPECT_EQ(off.entries[0].slot_code, "s10");
  EXPECT_EQ(off.entries[0].time_label, "TT 3:00-4:15");

  const AssignmentOutcome no_voters = solve_assignment(SlotCatalog::reference(), course_list(1), sat, {false},
                                                       params_with(ExclusionPolicy::voting), cbc());
  ASSERT_EQ(no_voters.failure, Failure::none) << no_voters.message;
  EXPECT_EQ(no_voters.entries[0].slot_code, "s10");
}

TEST(AssignmentSolverTest, RealisticPoolHonoursEveryConstraint) {
  const int C = 23;
  const SlotCatalog cat = SlotCatalog::reference();
  const PreferenceTable prefs = testing_util::random_preferences(C, 10, 42);
  SatisfactionModel model(4, 0.1, 1.0, 42);
  const SatisfactionMatrix sat = model.build_matrix(prefs, std::vector<double>(10, 0.5));
  std::vector<bool> voting(C, false);
  for (int c = 0; c < C; c += 3) voting[c] = true;

  const AssignmentOutcome out =
      solve_assignment(cat, course_list(C), sat, voting, params_with(ExclusionPolicy::voting), cbc());
  ASSERT_EQ(out.failure, Failure::none) << out.message;
  ASSERT_EQ(out.slot_of_course.size(), static_cast<std::size_t>(C));

  const ScheduleStats st = compute_stats(cat, out.slot_of_course, 2);
  for (const auto& kv : st.pattern_counts) EXPECT_GE(kv.second, day_pattern_floor(C, 2));
  const auto band = start_time_band(C, 5);
  for (const auto& kv : st.start_time_counts) {
    EXPECT_GE(kv.second, band.first);
    EXPECT_LE(kv.second, band.second);
  }
  double total = 0.0;
  for (int c = 0; c < C; ++c) {
    if (voting[c]) {
      EXPECT_NE(out.slot_of_course[c], 9);
    }
    total += sat[c][out.slot_of_course[c]];
  }
  EXPECT_NEAR(out.satisfaction_total, total, 1e-9);
}

TEST(AssignmentSolverTest, UnsatisfiableBandIsReportedWithoutEntries) {
  // Start time "10" holds only the barred slot but needs at least one course.
  const SlotCatalog cat({{0, "a", "", "P1", "9", ""}, {0, "b", "", "P2", "10", ""}}, "b");
  const SatisfactionMatrix sat(2, std::vector<double>{1.0, 1.0});
  const AssignmentOutcome out = solve_assignment(cat, course_list(2), sat, {false, false},
                                                 params_with(ExclusionPolicy::all), cbc());
  EXPECT_EQ(out.failure, Failure::infeasible_or_unsolved);
  EXPECT_TRUE(out.entries.empty());
  EXPECT_TRUE(out.slot_of_course.empty());
}

TEST(AssignmentSolverTest, UncertifiedIncumbentIsNotReturned) {
  ScriptedBackend backend;
  backend.status = MipStatus::feasible;
  const AssignmentOutcome out =
      solve_assignment(SlotCatalog::reference(), course_list(3), single_slot_matrix(3, 0, 1.0),
                       std::vector<bool>(3, false), params_with(ExclusionPolicy::voting), backend.factory());
  EXPECT_EQ(out.failure, Failure::infeasible_or_unsolved);
  EXPECT_TRUE(out.entries.empty());

  backend.status = MipStatus::not_solved;
  EXPECT_EQ(solve_assignment(SlotCatalog::reference(), course_list(3), single_slot_matrix(3, 0, 1.0),
                             std::vector<bool>(3, false), params_with(ExclusionPolicy::voting),
                             backend.factory())
                .failure,
            Failure::infeasible_or_unsolved);
}

TEST(AssignmentSolverTest, SolverFaultsAndCancellation) {
  const SatisfactionMatrix sat = single_slot_matrix(2, 0, 1.0);
  const std::vector<bool> voting(2, false);

  EXPECT_EQ(solve_assignment(SlotCatalog::reference(), course_list(2), sat, voting,
                             params_with(ExclusionPolicy::voting), testing_util::unavailable_backend())
                .failure,
            Failure::solver_fault);

  ScriptedBackend abnormal;
  abnormal.status = MipStatus::model_invalid;
  EXPECT_EQ(solve_assignment(SlotCatalog::reference(), course_list(2), sat, voting,
                             params_with(ExclusionPolicy::voting), abnormal.factory())
                .failure,
            Failure::solver_fault);

  // "optimal" with every variable at zero leaves courses without a slot
  ScriptedBackend empty_optimum;
  empty_optimum.status = MipStatus::optimal;
  const AssignmentOutcome broken = solve_assignment(SlotCatalog::reference(), course_list(2), sat, voting,
                                                    params_with(ExclusionPolicy::voting), empty_optimum.factory());
  EXPECT_EQ(broken.failure, Failure::solver_fault);
  EXPECT_TRUE(broken.entries.empty());

  ScriptedBackend cancelling;
  cancelling.cancel_during_solve = true;
  SolveControl control;
  AssignmentParams p = params_with(ExclusionPolicy::voting);
  p.control = &control;
  EXPECT_EQ(solve_assignment(SlotCatalog::reference(), course_list(2), sat, voting, p, cancelling.factory())
                .failure,
            Failure::aborted);
}

TEST(AssignmentSolverTest, NoCoursesNeedsNoSolve) {
  ScriptedBackend backend;
  const AssignmentOutcome out = solve_assignment(SlotCatalog::reference(), {}, {}, {},
                                                 params_with(ExclusionPolicy::voting), backend.factory());
  EXPECT_EQ(out.failure, Failure::none);
  EXPECT_TRUE(out.entries.empty());
  EXPECT_EQ(out.satisfaction_total, 0.0);
  EXPECT_EQ(backend.models_created, 0);
}

TEST(AssignmentSolverTest, MismatchedShapesAreRejected) {
  const SatisfactionMatrix short_rows(2, std::vector<double>(9, 0.0));
  EXPECT_THROW(solve_assignment(SlotCatalog::reference(), course_list(2), short_rows, {false, false},
                                params_with(ExclusionPolicy::voting), cbc()),
               MalformedInput);
  EXPECT_THROW(solve_assignment(SlotCatalog::reference(), course_list(2), single_slot_matrix(2, 0, 1.0),
                                {false}, params_with(ExclusionPolicy::voting), cbc()),
               MalformedInput);
}

}  // namespace
}  // namespace slotopt
