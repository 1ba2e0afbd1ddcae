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

#ifndef COURSE_PLANNER_SCHEDULING_REQUIREMENT_RESOLVER_H_
#define COURSE_PLANNER_SCHEDULING_REQUIREMENT_RESOLVER_H_

#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "course_planner/catalog/course_catalog.h"
#include "course_planner/scheduling/planner_parameters.pb.h"
#include "google/protobuf/repeated_ptr_field.h"

namespace course_planner {

// Name of the requirement synthesized from the elective subject.
inline constexpr absl::string_view kElectiveRequirementName = "electives";

// An ordered choice of courses, one requirement group after the other.
using CourseSlate = std::vector<const Course*>;

// A requirement whose groups only contain courses with at least one section.
struct ResolvedRequirement {
  std::string name;
  std::vector<std::vector<const Course*>> groups;
};

// Fills in the default requirements when `parameters` has none. The defaults
// are rebuilt on every call.
void AddDefaultRequirementsIfEmpty(SchedulePlannerParameters* parameters);

// Resolves the course codes of each requirement against the catalog. A group
// naming an unknown course, or a course without sections, is dropped. If
// `elective_subject_code` is not empty, a last requirement named "electives"
// is appended with one singleton group per course of that subject that has
// sections, in catalog order.
//
// Requirements left without groups are kept (with no groups) so that callers
// can report them; see BuildCourseSlates().
std::vector<ResolvedRequirement> ResolveRequirements(
    const google::protobuf::RepeatedPtrField<Requirement>& requirements,
    const CourseCatalog& catalog,
    absl::string_view elective_subject_code);

// Same as above, taking the requirements and the elective subject from the
// parameters.
std::vector<ResolvedRequirement> ResolveRequirements(
    const SchedulePlannerParameters& parameters, const CourseCatalog& catalog);

// Returns the Cartesian product of the requirement groups: every way of
// picking one group per requirement, flattened into the courses of the picked
// groups in requirement order. Returns no slate at all as soon as one
// requirement has no group, since nothing can then satisfy every requirement.
std::vector<CourseSlate> BuildCourseSlates(
    absl::Span<const ResolvedRequirement> requirements);

}  // namespace course_planner

#endif  // COURSE_PLANNER_SCHEDULING_REQUIREMENT_RESOLVER_H_
