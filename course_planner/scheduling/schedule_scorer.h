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

#ifndef COURSE_PLANNER_SCHEDULING_SCHEDULE_SCORER_H_
#define COURSE_PLANNER_SCHEDULING_SCHEDULE_SCORER_H_

#include <functional>
#include <string>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "course_planner/catalog/course_catalog.h"
#include "course_planner/scheduling/planner_parameters.pb.h"

namespace course_planner {

// A caller-supplied term added to the score of every schedule. It may be
// negative (a penalty) or positive. A failing or throwing adjustment, or one
// returning a non-finite value, is logged and ignored for that schedule.
using ScoreAdjustment =
    std::function<absl::StatusOr<double>(absl::Span<const Section* const>)>;

// The terms of the score of a schedule, before rounding. Penalties are
// negative.
struct ScoreBreakdown {
  double time_of_day = 0.0;
  double active_days = 0.0;
  double distribution = 0.0;
  double idle_time = 0.0;
  double span = 0.0;
  double adjustments = 0.0;

  double Total() const {
    return time_of_day + active_days + distribution + idle_time + span +
           adjustments;
  }
  std::string DebugString() const;
};

// Computes the unrounded terms of the score of a non-empty schedule:
//  - meetings starting before the early threshold, or ending after the late
//    one, are penalized per minute outside the threshold,
//  - a number of active days inside the ideal range earns a bonus; otherwise
//    each day of distance to the upper bound of the range is penalized,
//  - with several active days, the sample standard deviation of the number of
//    meetings per active day is penalized,
//  - the idle minutes of each active day (its first-to-last span minus its
//    class time) are penalized,
//  - the mean first-to-last span of the active days is penalized,
//  - the adjustments are added.
ScoreBreakdown ComputeScoreBreakdown(
    absl::Span<const Section* const> schedule, const ScoringWeights& weights,
    absl::Span<const ScoreAdjustment> adjustments = {});

// Score of a schedule, higher is better, rounded to 2 decimals with halves
// rounded to even. An empty
// schedule scores -infinity.
double ScoreSchedule(absl::Span<const Section* const> schedule,
                     const ScoringWeights& weights,
                     absl::Span<const ScoreAdjustment> adjustments = {});

}  // namespace course_planner

#endif  // COURSE_PLANNER_SCHEDULING_SCHEDULE_SCORER_H_
