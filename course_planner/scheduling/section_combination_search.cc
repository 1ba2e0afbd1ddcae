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

#include "course_planner/scheduling/section_combination_search.h"

#include <cstdint>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "course_planner/base/logging.h"
#include "course_planner/catalog/course_catalog.h"

namespace course_planner {

std::string SearchStats::DebugString() const {
  return absl::StrCat("slates_examined: ", slates_examined,
                      " slates_pruned: ", slates_pruned,
                      " candidates_found: ", candidates_found,
                      " frontier_truncations: ", frontier_truncations);
}

bool IsCompatible(const Section& section,
                  absl::Span<const Section* const> partial) {
  for (const Section* const chosen : partial) {
    if (section.ConflictsWith(*chosen)) return false;
  }
  return true;
}

void SectionCombinationSearch::EnumerateSlate(
    absl::Span<const Course* const> slate,
    std::vector<ScheduleCandidate>* candidates) {
  ++stats_.slates_examined;
  std::vector<ScheduleCandidate> frontier(1);
  for (const Course* const course : slate) {
    std::vector<ScheduleCandidate> next_frontier;
    bool truncated = false;
    for (const Section& section : course->sections()) {
      for (const ScheduleCandidate& partial : frontier) {
        if (!IsCompatible(section, partial)) continue;
        if (FrontierIsFull(next_frontier.size())) {
          truncated = true;
          break;
        }
        ScheduleCandidate& extended = next_frontier.emplace_back(partial);
        extended.push_back(&section);
      }
      if (truncated) break;
    }
    if (truncated) {
      ++stats_.frontier_truncations;
      LOG(WARNING) << "Frontier truncated to " << max_frontier_size_
                   << " partial schedules at course " << course->code();
    }
    frontier = std::move(next_frontier);
    if (frontier.empty()) {
      VLOG(2) << "No conflict-free assignment once " << course->code()
              << " is added.";
      ++stats_.slates_pruned;
      return;
    }
  }
  stats_.candidates_found += frontier.size();
  candidates->insert(candidates->end(),
                     std::make_move_iterator(frontier.begin()),
                     std::make_move_iterator(frontier.end()));
}

std::vector<ScheduleCandidate> SectionCombinationSearch::EnumerateAll(
    absl::Span<const CourseSlate> slates) {
  std::vector<ScheduleCandidate> candidates;
  for (const CourseSlate& slate : slates) {
    EnumerateSlate(slate, &candidates);
  }
  return candidates;
}

std::vector<ScheduleCandidate> GenerateSectionCombinations(
    absl::Span<const Course* const> slate) {
  SectionCombinationSearch search;
  std::vector<ScheduleCandidate> candidates;
  search.EnumerateSlate(slate, &candidates);
  return candidates;
}

}  // namespace course_planner
