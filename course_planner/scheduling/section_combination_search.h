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

// Enumeration of the conflict-free section assignments of course slates.
//
// For a slate of courses C_1, ..., C_n, a candidate schedule picks one section
// of each C_i such that no two picked sections have overlapping meetings. The
// search extends a frontier of mutually compatible partial assignments one
// course at a time, and only admits a section into a partial assignment if it
// conflicts with none of its sections. Its cost is thus bounded by the size of
// the frontiers that are actually realizable rather than by the product of the
// section counts. The search for a slate stops as soon as its frontier becomes
// empty.

#ifndef COURSE_PLANNER_SCHEDULING_SECTION_COMBINATION_SEARCH_H_
#define COURSE_PLANNER_SCHEDULING_SECTION_COMBINATION_SEARCH_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/types/span.h"
#include "course_planner/catalog/course_catalog.h"
#include "course_planner/scheduling/requirement_resolver.h"

namespace course_planner {

// One section per course of a slate, in slate order.
using ScheduleCandidate = std::vector<const Section*>;

struct SearchStats {
  int64_t slates_examined = 0;
  // Slates that ended with an empty frontier.
  int64_t slates_pruned = 0;
  int64_t candidates_found = 0;
  // Number of times a frontier was cut at max_frontier_size.
  int64_t frontier_truncations = 0;

  std::string DebugString() const;
};

class SectionCombinationSearch {
 public:
  // A positive `max_frontier_size` caps the number of partial assignments
  // kept after each course; the extensions beyond the cap are dropped.
  explicit SectionCombinationSearch(int64_t max_frontier_size = 0)
      : max_frontier_size_(max_frontier_size) {}

  // Appends to `candidates` all the conflict-free assignments of `slate`.
  // A slate containing a course without sections has none.
  void EnumerateSlate(absl::Span<const Course* const> slate,
                      std::vector<ScheduleCandidate>* candidates);

  // Concatenation of the assignments of all the slates, in slate order.
  std::vector<ScheduleCandidate> EnumerateAll(
      absl::Span<const CourseSlate> slates);

  const SearchStats& stats() const { return stats_; }

 private:
  bool FrontierIsFull(size_t size) const {
    return max_frontier_size_ > 0 &&
           static_cast<int64_t>(size) >= max_frontier_size_;
  }

  const int64_t max_frontier_size_;
  SearchStats stats_;
};

// True iff `section` conflicts with none of the sections of `partial`.
bool IsCompatible(const Section& section,
                  absl::Span<const Section* const> partial);

// Convenience wrapper for an unbounded search of a single slate.
std::vector<ScheduleCandidate> GenerateSectionCombinations(
    absl::Span<const Course* const> slate);

}  // namespace course_planner

#endif  // COURSE_PLANNER_SCHEDULING_SECTION_COMBINATION_SEARCH_H_
