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

#include "course_planner/scheduling/schedule_planner.h"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/types/span.h"
#include "course_planner/base/logging.h"
#include "course_planner/base/status_builder.h"
#include "course_planner/base/status_macros.h"
#include "course_planner/catalog/catalog_normalizer.h"
#include "course_planner/catalog/course_catalog.h"
#include "course_planner/catalog/meeting_time.h"
#include "course_planner/scheduling/planner_parameters.pb.h"
#include "course_planner/scheduling/requirement_resolver.h"
#include "course_planner/scheduling/schedule_response.pb.h"
#include "course_planner/scheduling/schedule_scorer.h"
#include "course_planner/scheduling/section_combination_search.h"
#include "google/protobuf/struct.pb.h"
#include "google/protobuf/stubs/common.h"
#include "google/protobuf/util/json_util.h"

namespace course_planner {
namespace {

constexpr int kMinutesPerDay = 24 * 60;

absl::Status ValidateScoringWeights(const ScoringWeights& weights) {
  if (weights.early_class_threshold() < 0 ||
      weights.early_class_threshold() > kMinutesPerDay) {
    return absl::InvalidArgumentError(
        absl::StrFormat("early_class_threshold must be in [0, %d], got %d",
                        kMinutesPerDay, weights.early_class_threshold()));
  }
  if (weights.late_class_threshold() < 0 ||
      weights.late_class_threshold() > kMinutesPerDay) {
    return absl::InvalidArgumentError(
        absl::StrFormat("late_class_threshold must be in [0, %d], got %d",
                        kMinutesPerDay, weights.late_class_threshold()));
  }
  if (weights.ideal_active_days_min() < 0 ||
      weights.ideal_active_days_max() > kNumWeekdays ||
      weights.ideal_active_days_min() > weights.ideal_active_days_max()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "The ideal active day range [%d, %d] must be a non-empty range "
        "within [0, %d]",
        weights.ideal_active_days_min(), weights.ideal_active_days_max(),
        kNumWeekdays));
  }
  return absl::OkStatus();
}

absl::Status ValidateRequirement(const Requirement& requirement) {
  if (requirement.name().empty()) {
    return InvalidArgumentErrorBuilder() << "A requirement has no name.";
  }
  if (requirement.name() == kElectiveRequirementName) {
    return InvalidArgumentErrorBuilder()
           << "The requirement name '" << kElectiveRequirementName
           << "' is reserved for electives.";
  }
  for (int g = 0; g < requirement.groups_size(); ++g) {
    const RequirementGroup& group = requirement.groups(g);
    if (group.course_codes().empty()) {
      return InvalidArgumentErrorBuilder()
             << "Group " << g << " of requirement '" << requirement.name()
             << "' has no course.";
    }
    for (const std::string& code : group.course_codes()) {
      if (code.empty()) {
        return InvalidArgumentErrorBuilder()
               << "Group " << g << " of requirement '" << requirement.name()
               << "' has an empty course code.";
      }
    }
  }
  return absl::OkStatus();
}

}  // namespace

absl::Status ValidateParameters(const SchedulePlannerParameters& parameters) {
  if (parameters.max_schedules() <= 0) {
    return absl::InvalidArgumentError(absl::StrCat(
        "max_schedules must be positive, got ", parameters.max_schedules()));
  }
  if (parameters.min_seats_available() < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("min_seats_available must be non-negative, got ",
                     parameters.min_seats_available()));
  }
  if (parameters.max_frontier_size() < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("max_frontier_size must be non-negative, got ",
                     parameters.max_frontier_size()));
  }
  RETURN_IF_ERROR(ValidateScoringWeights(parameters.scoring()));

  absl::flat_hash_set<std::string> names;
  for (const Requirement& requirement : parameters.requirements()) {
    RETURN_IF_ERROR(ValidateRequirement(requirement));
    if (!names.insert(requirement.name()).second) {
      return InvalidArgumentErrorBuilder()
             << "Duplicate requirement name '" << requirement.name() << "'.";
    }
  }
  return absl::OkStatus();
}

CatalogFilter CatalogFilterFromParameters(
    const SchedulePlannerParameters& parameters) {
  CatalogFilter filter;
  filter.min_seats_available = parameters.min_seats_available();
  filter.include_subjects.insert(parameters.include_subjects().begin(),
                                 parameters.include_subjects().end());
  filter.exclude_subjects.insert(parameters.exclude_subjects().begin(),
                                 parameters.exclude_subjects().end());
  return filter;
}

std::vector<ScoredSchedule> RankSchedules(
    std::vector<ScheduleCandidate> candidates, const ScoringWeights& weights,
    absl::Span<const ScoreAdjustment> adjustments, int max_schedules) {
  std::vector<ScoredSchedule> scored;
  scored.reserve(candidates.size());
  for (ScheduleCandidate& candidate : candidates) {
    if (candidate.empty()) continue;
    const double score = ScoreSchedule(candidate, weights, adjustments);
    scored.push_back({std::move(candidate), score});
  }
  std::stable_sort(scored.begin(), scored.end(),
                   [](const ScoredSchedule& a, const ScoredSchedule& b) {
                     return a.score > b.score;
                   });
  if (max_schedules >= 0 &&
      scored.size() > static_cast<size_t>(max_schedules)) {
    scored.resize(max_schedules);
  }
  return scored;
}

absl::StatusOr<std::string> ResponseToJson(const ScheduleResponse& response) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
#if GOOGLE_PROTOBUF_VERSION >= 5026000
  options.always_print_fields_with_no_presence = true;
#else
  options.always_print_primitive_fields = true;
#endif
  options.preserve_proto_field_names = true;
  std::string json;
  const auto status =
      google::protobuf::util::MessageToJsonString(response, &json, options);
  if (!status.ok()) {
    return absl::InternalError(
        absl::StrCat("Could not serialize the response: ", status.ToString()));
  }
  return json;
}

void AppendScheduleOptions(absl::Span<const ScoredSchedule> schedules,
                           ScheduleResponse* response) {
  for (const ScoredSchedule& schedule : schedules) {
    ScheduleOption* const option = response->add_options();
    option->set_label(absl::StrCat("Schedule ", response->options_size()));
    option->set_score(schedule.score);
    double total_credits = 0.0;
    for (const Section* const section : schedule.candidate) {
      const Course& course = section->course();
      ScheduledSection* const scheduled = option->add_sections();
      scheduled->set_id(section->id());
      scheduled->set_course_code(course.code());
      scheduled->set_title(course.title());
      scheduled->set_credits(course.credits());
      total_credits += course.credits();
      for (const MeetingTime& meeting : section->meeting_times()) {
        MeetingSlot* const slot = scheduled->add_meetings();
        slot->set_day_name(std::string(WeekdayName(meeting.day())));
        slot->set_begin(FormatHhmm(meeting.begin()));
        slot->set_end(FormatHhmm(meeting.end()));
      }
    }
    option->set_total_credits(total_credits);
  }
}

SchedulePlanner::SchedulePlanner(const SchedulePlannerParameters& parameters)
    : parameters_(parameters) {
  AddDefaultRequirementsIfEmpty(&parameters_);
}

void SchedulePlanner::AddScoreAdjustment(ScoreAdjustment adjustment) {
  adjustments_.push_back(std::move(adjustment));
}

absl::StatusOr<ScheduleResponse> SchedulePlanner::Solve(
    const google::protobuf::ListValue& records) {
  RETURN_IF_ERROR(ValidateParameters(parameters_));
  CourseCatalog catalog;
  CatalogNormalizer normalizer(CatalogFilterFromParameters(parameters_));
  normalizer.AddRecords(records, &catalog);
  normalization_stats_ = normalizer.stats();
  LOG(INFO) << "Normalized section records: "
            << normalization_stats_.DebugString();
  return SolveWithCatalog(catalog);
}

absl::StatusOr<ScheduleResponse> SchedulePlanner::SolveWithCatalog(
    const CourseCatalog& catalog) {
  RETURN_IF_ERROR(ValidateParameters(parameters_));
  ScheduleResponse response;
  response.set_num_courses(catalog.num_courses());
  response.set_num_sections(catalog.num_sections());

  const std::vector<ResolvedRequirement> requirements =
      ResolveRequirements(parameters_, catalog);
  const std::vector<CourseSlate> slates = BuildCourseSlates(requirements);
  response.set_num_course_slates(slates.size());
  LOG(INFO) << "Number of requirements: " << requirements.size();
  LOG(INFO) << "Number of course slates: " << slates.size();
  if (slates.empty()) return response;

  SectionCombinationSearch search(parameters_.max_frontier_size());
  std::vector<ScheduleCandidate> candidates = search.EnumerateAll(slates);
  search_stats_ = search.stats();
  response.set_num_candidates(candidates.size());
  LOG(INFO) << "Number of conflict-free schedules: " << candidates.size();
  VLOG(1) << "Search: " << search_stats_.DebugString();

  const std::vector<ScoredSchedule> best =
      RankSchedules(std::move(candidates), parameters_.scoring(), adjustments_,
                    parameters_.max_schedules());
  AppendScheduleOptions(best, &response);
  return response;
}

}  // namespace course_planner
