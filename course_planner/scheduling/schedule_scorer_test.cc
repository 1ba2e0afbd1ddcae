// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "course_planner/scheduling/schedule_scorer.h"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "course_planner/catalog/course_catalog.h"
#include "course_planner/catalog/meeting_time.h"
#include "course_planner/scheduling/planner_parameters.pb.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace course_planner {
namespace {

class ScheduleScorerTest : public ::testing::Test {
 protected:
  const Section* AddSection(std::vector<MeetingTime> meetings) {
    Course* const course = catalog_.FindOrAddCourse(
        absl::StrCat("C", catalog_.num_courses()), "X", "Course", 4.0);
    course->AddSection("1", std::move(meetings));
    return &course->sections()[0];
  }

  const Section* AddMwf(int begin, int end) {
    return AddSection({MeetingTime(Weekday::kMonday, begin, end),
                       MeetingTime(Weekday::kWednesday, begin, end),
                       MeetingTime(Weekday::kFriday, begin, end)});
  }

  CourseCatalog catalog_;
  const ScoringWeights weights_;
};

TEST_F(ScheduleScorerTest, EmptyScheduleScoresMinusInfinity) {
  EXPECT_EQ(ScoreSchedule({}, weights_),
            -std::numeric_limits<double>::infinity());
}

TEST_F(ScheduleScorerTest, ThreeDaysMidMorning) {
  const std::vector<const Section*> schedule = {AddMwf(600, 650)};
  const ScoreBreakdown breakdown = ComputeScoreBreakdown(schedule, weights_);
  EXPECT_EQ(breakdown.time_of_day, 0.0);
  EXPECT_EQ(breakdown.active_days, 100.0);
  EXPECT_EQ(breakdown.distribution, 0.0);
  EXPECT_EQ(breakdown.idle_time, 0.0);
  EXPECT_DOUBLE_EQ(breakdown.span, -2.5);
  EXPECT_DOUBLE_EQ(ScoreSchedule(schedule, weights_), 97.5);
}

TEST_F(ScheduleScorerTest, EarlyClassLowersTheScore) {
  const Section* const mwf = AddMwf(600, 650);
  const Section* const early =
      AddSection({MeetingTime(Weekday::kTuesday, 420, 470)});
  const std::vector<const Section*> schedule = {mwf, early};
  const ScoreBreakdown breakdown = ComputeScoreBreakdown(schedule, weights_);
  EXPECT_DOUBLE_EQ(breakdown.time_of_day, -36.0);
  EXPECT_EQ(breakdown.active_days, 100.0);
  EXPECT_DOUBLE_EQ(ScoreSchedule(schedule, weights_), 61.5);
  EXPECT_LT(ScoreSchedule(schedule, weights_),
            ScoreSchedule(std::vector<const Section*>{mwf}, weights_));
}

TEST_F(ScheduleScorerTest, LateClassIsPenalizedPerMinute) {
  const std::vector<const Section*> schedule = {
      AddSection({MeetingTime(Weekday::kThursday, 1050, 1130)})};
  EXPECT_DOUBLE_EQ(ComputeScoreBreakdown(schedule, weights_).time_of_day,
                   -10.0);
}

TEST_F(ScheduleScorerTest, SingleBusyDay) {
  const std::vector<const Section*> schedule = {
      AddSection({MeetingTime(Weekday::kMonday, 540, 590)}),
      AddSection({MeetingTime(Weekday::kMonday, 660, 710)})};
  const ScoreBreakdown breakdown = ComputeScoreBreakdown(schedule, weights_);
  EXPECT_EQ(breakdown.active_days, -150.0);
  EXPECT_EQ(breakdown.distribution, 0.0);
  EXPECT_DOUBLE_EQ(breakdown.idle_time, -3.5);
  EXPECT_DOUBLE_EQ(breakdown.span, -8.5);
  EXPECT_DOUBLE_EQ(ScoreSchedule(schedule, weights_), -162.0);
}

TEST_F(ScheduleScorerTest, UnevenDaysArePenalized) {
  const std::vector<const Section*> schedule = {
      AddSection({MeetingTime(Weekday::kMonday, 600, 650),
                  MeetingTime(Weekday::kTuesday, 600, 650),
                  MeetingTime(Weekday::kWednesday, 600, 650)}),
      AddSection({MeetingTime(Weekday::kMonday, 700, 750)})};
  // Meetings per day are {2, 1, 1}: the sample standard deviation is
  // sqrt(1/3).
  EXPECT_NEAR(ComputeScoreBreakdown(schedule, weights_).distribution,
              -20.0 * std::sqrt(1.0 / 3.0), 1e-9);
}

TEST_F(ScheduleScorerTest, SpanIsTheMeanOverActiveDays) {
  const std::vector<const Section*> schedule = {
      AddSection({MeetingTime(Weekday::kMonday, 600, 650)}),
      AddSection({MeetingTime(Weekday::kTuesday, 600, 655)})};
  const ScoreBreakdown breakdown = ComputeScoreBreakdown(schedule, weights_);
  EXPECT_DOUBLE_EQ(breakdown.span, -(50.0 + 55.0) / 2 * 0.05);
  EXPECT_DOUBLE_EQ(breakdown.Total(), -102.625);
}

TEST_F(ScheduleScorerTest, HalvesAreRoundedToEven) {
  const std::vector<const Section*> schedule = {
      AddSection({MeetingTime(Weekday::kMonday, 600, 650)}),
      AddSection({MeetingTime(Weekday::kTuesday, 600, 655)})};
  EXPECT_DOUBLE_EQ(ScoreSchedule(schedule, weights_), -102.62);
}

TEST_F(ScheduleScorerTest, TooManyActiveDays) {
  ScoringWeights weights;
  weights.set_ideal_active_days_min(1);
  weights.set_ideal_active_days_max(2);
  const std::vector<const Section*> schedule = {AddMwf(600, 650)};
  EXPECT_EQ(ComputeScoreBreakdown(schedule, weights).active_days, -50.0);
}

TEST_F(ScheduleScorerTest, AdjustmentsAreAddedAndRounded) {
  const std::vector<const Section*> schedule = {AddMwf(600, 650)};
  const std::vector<ScoreAdjustment> adjustments = {
      [](absl::Span<const Section* const> sections) -> absl::StatusOr<double> {
        return 0.126 * sections.size();
      }};
  EXPECT_DOUBLE_EQ(ScoreSchedule(schedule, weights_, adjustments), 97.63);
}

TEST_F(ScheduleScorerTest, FailingAdjustmentsAreIgnored) {
  const std::vector<const Section*> schedule = {AddMwf(600, 650)};
  const std::vector<ScoreAdjustment> adjustments = {
      [](absl::Span<const Section* const>) -> absl::StatusOr<double> {
        return absl::InternalError("no data");
      },
      [](absl::Span<const Section* const>) -> absl::StatusOr<double> {
        return std::numeric_limits<double>::quiet_NaN();
      },
      [](absl::Span<const Section* const>) -> absl::StatusOr<double> {
        throw std::out_of_range("no such section");
      },
      [](absl::Span<const Section* const>) -> absl::StatusOr<double> {
        return -7.5;
      }};
  const ScoreBreakdown breakdown =
      ComputeScoreBreakdown(schedule, weights_, adjustments);
  EXPECT_EQ(breakdown.adjustments, -7.5);
  EXPECT_DOUBLE_EQ(ScoreSchedule(schedule, weights_, adjustments), 90.0);
}

}  // namespace
}  // namespace course_planner
