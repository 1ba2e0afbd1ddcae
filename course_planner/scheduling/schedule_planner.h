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

#ifndef COURSE_PLANNER_SCHEDULING_SCHEDULE_PLANNER_H_
#define COURSE_PLANNER_SCHEDULING_SCHEDULE_PLANNER_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "course_planner/catalog/catalog_normalizer.h"
#include "course_planner/catalog/course_catalog.h"
#include "course_planner/scheduling/planner_parameters.pb.h"
#include "course_planner/scheduling/schedule_response.pb.h"
#include "course_planner/scheduling/schedule_scorer.h"
#include "course_planner/scheduling/section_combination_search.h"
#include "google/protobuf/struct.pb.h"

namespace course_planner {

// Returns an InvalidArgumentError describing the first problem found, if any.
absl::Status ValidateParameters(const SchedulePlannerParameters& parameters);

// The seat and subject filters of the parameters.
CatalogFilter CatalogFilterFromParameters(
    const SchedulePlannerParameters& parameters);

// A candidate schedule with its score.
struct ScoredSchedule {
  ScheduleCandidate candidate;
  double score = 0.0;
};

// Scores every candidate and returns the best `max_schedules` of them by
// non-increasing score. Equal scores keep their relative order. Candidates
// without any section are never returned.
std::vector<ScoredSchedule> RankSchedules(
    std::vector<ScheduleCandidate> candidates, const ScoringWeights& weights,
    absl::Span<const ScoreAdjustment> adjustments, int max_schedules);

// Projects ranked schedules to their transport-neutral form, labeled
// "Schedule 1", "Schedule 2", ...
void AppendScheduleOptions(absl::Span<const ScoredSchedule> schedules,
                           ScheduleResponse* response);

// Serializes a response as indented JSON with the proto field names. Fields
// holding their default value are printed too.
absl::StatusOr<std::string> ResponseToJson(const ScheduleResponse& response);

// Generates the best conflict-free weekly schedules satisfying the
// requirements of the parameters from a feed of section records.
//
// Usage:
//   SchedulePlanner planner(parameters);
//   planner.AddScoreAdjustment(NoFridayClasses);
//   ASSIGN_OR_RETURN(const ScheduleResponse response, planner.Solve(records));
//
// An unsatisfiable requirement is not an error: the response then simply
// has no option. Invalid parameters are reported before any work is done.
class SchedulePlanner {
 public:
  explicit SchedulePlanner(const SchedulePlannerParameters& parameters);

  // Registers a term added to the score of every schedule.
  void AddScoreAdjustment(ScoreAdjustment adjustment);

  // Normalizes the records into a fresh catalog, then plans on it.
  absl::StatusOr<ScheduleResponse> Solve(
      const google::protobuf::ListValue& records);

  // Plans on an already normalized catalog.
  absl::StatusOr<ScheduleResponse> SolveWithCatalog(
      const CourseCatalog& catalog);

  // The parameters actually used, with the default requirements filled in.
  const SchedulePlannerParameters& parameters() const { return parameters_; }

  const NormalizationStats& normalization_stats() const {
    return normalization_stats_;
  }
  const SearchStats& search_stats() const { return search_stats_; }

 private:
  SchedulePlannerParameters parameters_;
  std::vector<ScoreAdjustment> adjustments_;
  NormalizationStats normalization_stats_;
  SearchStats search_stats_;
};

}  // namespace course_planner

#endif  // COURSE_PLANNER_SCHEDULING_SCHEDULE_PLANNER_H_
