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

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <limits>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "course_planner/base/logging.h"
#include "course_planner/catalog/course_catalog.h"
#include "course_planner/catalog/meeting_time.h"
#include "course_planner/scheduling/planner_parameters.pb.h"

namespace course_planner {
namespace {

// Sample standard deviation. Requires at least two values.
double SampleStandardDeviation(absl::Span<const int> values) {
  DCHECK_GE(values.size(), 2);
  double sum = 0.0;
  for (const int value : values) sum += value;
  const double mean = sum / values.size();
  double squares = 0.0;
  for (const int value : values) {
    squares += (value - mean) * (value - mean);
  }
  return std::sqrt(squares / (values.size() - 1));
}

// Halves are rounded to even, under the default rounding mode.
double RoundToCents(double value) {
  return std::nearbyint(value * 100.0) / 100.0;
}

// Runs one adjustment. A thrown exception is turned into an error status.
absl::StatusOr<double> RunAdjustment(
    const ScoreAdjustment& adjustment,
    absl::Span<const Section* const> schedule) {
  try {
    return adjustment(schedule);
  } catch (const std::exception& e) {
    return absl::InternalError(e.what());
  }
}

}  // namespace

std::string ScoreBreakdown::DebugString() const {
  return absl::StrCat("time_of_day: ", time_of_day,
                      " active_days: ", active_days,
                      " distribution: ", distribution,
                      " idle_time: ", idle_time, " span: ", span,
                      " adjustments: ", adjustments, " total: ", Total());
}

ScoreBreakdown ComputeScoreBreakdown(
    absl::Span<const Section* const> schedule, const ScoringWeights& weights,
    absl::Span<const ScoreAdjustment> adjustments) {
  ScoreBreakdown breakdown;
  std::array<std::vector<const MeetingTime*>, kNumWeekdays> meetings_by_day;

  const double rate = weights.early_late_penalty_per_minute();
  for (const Section* const section : schedule) {
    for (const MeetingTime& meeting : section->meeting_times()) {
      meetings_by_day[WeekdayIndex(meeting.day())].push_back(&meeting);
      if (meeting.begin() < weights.early_class_threshold()) {
        breakdown.time_of_day -=
            (weights.early_class_threshold() - meeting.begin()) * rate;
      }
      if (meeting.end() > weights.late_class_threshold()) {
        breakdown.time_of_day -=
            (meeting.end() - weights.late_class_threshold()) * rate;
      }
    }
  }

  std::vector<int> meetings_per_active_day;
  std::vector<int> spans;
  for (const std::vector<const MeetingTime*>& day : meetings_by_day) {
    if (day.empty()) continue;
    meetings_per_active_day.push_back(day.size());
    int first_begin = std::numeric_limits<int>::max();
    int last_end = std::numeric_limits<int>::min();
    int class_minutes = 0;
    for (const MeetingTime* const meeting : day) {
      first_begin = std::min(first_begin, meeting->begin());
      last_end = std::max(last_end, meeting->end());
      class_minutes += meeting->duration();
    }
    const int span = last_end - first_begin;
    spans.push_back(span);
    breakdown.idle_time -=
        (span - class_minutes) * weights.idle_time_penalty_per_minute();
  }

  const int active_days = meetings_per_active_day.size();
  if (weights.ideal_active_days_min() <= active_days &&
      active_days <= weights.ideal_active_days_max()) {
    breakdown.active_days = weights.active_day_bonus();
  } else {
    breakdown.active_days =
        -std::abs(active_days - weights.ideal_active_days_max()) *
        weights.active_day_penalty_per_day();
  }

  if (active_days > 1) {
    breakdown.distribution = -SampleStandardDeviation(meetings_per_active_day) *
                             weights.distribution_weight();
  }

  if (!spans.empty()) {
    double total_span = 0.0;
    for (const int span : spans) total_span += span;
    breakdown.span =
        -(total_span / spans.size()) * weights.span_penalty_per_minute();
  }

  for (int i = 0; i < static_cast<int>(adjustments.size()); ++i) {
    const absl::StatusOr<double> delta =
        RunAdjustment(adjustments[i], schedule);
    if (!delta.ok()) {
      LOG(WARNING) << "Score adjustment #" << i
                   << " failed; ignoring it: " << delta.status();
      continue;
    }
    if (!std::isfinite(*delta)) {
      LOG(WARNING) << "Score adjustment #" << i << " returned " << *delta
                   << "; ignoring it.";
      continue;
    }
    breakdown.adjustments += *delta;
  }
  return breakdown;
}

double ScoreSchedule(absl::Span<const Section* const> schedule,
                     const ScoringWeights& weights,
                     absl::Span<const ScoreAdjustment> adjustments) {
  if (schedule.empty()) return -std::numeric_limits<double>::infinity();
  return RoundToCents(
      ComputeScoreBreakdown(schedule, weights, adjustments).Total());
}

}  // namespace course_planner
