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

#include "course_planner/scheduling/requirement_resolver.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "course_planner/base/logging.h"
#include "course_planner/catalog/course_catalog.h"
#include "course_planner/scheduling/planner_parameters.pb.h"

namespace course_planner {
namespace {

void AddRequirement(absl::string_view name,
                    const std::vector<std::vector<std::string>>& groups,
                    SchedulePlannerParameters* parameters) {
  Requirement* const requirement = parameters->add_requirements();
  requirement->set_name(std::string(name));
  for (const std::vector<std::string>& codes : groups) {
    RequirementGroup* const group = requirement->add_groups();
    for (const std::string& code : codes) group->add_course_codes(code);
  }
}

// Returns an empty vector if any course of the group is unknown or has no
// section.
std::vector<const Course*> ResolveGroup(const RequirementGroup& group,
                                        const CourseCatalog& catalog) {
  std::vector<const Course*> courses;
  for (const std::string& code : group.course_codes()) {
    const Course* const course = catalog.FindCourse(code);
    if (course == nullptr || !course->has_sections()) {
      VLOG(1) << "Dropping group: " << code
              << (course == nullptr ? " is not offered" : " has no sections");
      return {};
    }
    courses.push_back(course);
  }
  return courses;
}

}  // namespace

void AddDefaultRequirementsIfEmpty(SchedulePlannerParameters* parameters) {
  if (parameters->requirements_size() > 0) return;
  AddRequirement("cs_requirement", {{"CSCI1200"}}, parameters);
  AddRequirement("math_requirement", {{"MATH1020"}}, parameters);
  AddRequirement("biol_requirement",
                 {{"BIOL1010", "BIOL1015"}, {"BIOL1010", "BIOL1016"}},
                 parameters);
}

std::vector<ResolvedRequirement> ResolveRequirements(
    const google::protobuf::RepeatedPtrField<Requirement>& requirements,
    const CourseCatalog& catalog, absl::string_view elective_subject_code) {
  std::vector<ResolvedRequirement> resolved;
  resolved.reserve(requirements.size() + 1);
  for (const Requirement& requirement : requirements) {
    ResolvedRequirement& current = resolved.emplace_back();
    current.name = requirement.name();
    for (const RequirementGroup& group : requirement.groups()) {
      std::vector<const Course*> courses = ResolveGroup(group, catalog);
      if (!courses.empty()) current.groups.push_back(std::move(courses));
    }
    if (current.groups.empty()) {
      LOG(INFO) << "Requirement '" << current.name
                << "' cannot be satisfied by the catalog.";
    }
  }

  if (!elective_subject_code.empty()) {
    ResolvedRequirement& electives = resolved.emplace_back();
    electives.name = std::string(kElectiveRequirementName);
    for (const std::unique_ptr<Course>& course : catalog.courses()) {
      if (course->subject() == elective_subject_code &&
          course->has_sections()) {
        electives.groups.push_back({course.get()});
      }
    }
    if (electives.groups.empty()) {
      LOG(INFO) << "No " << elective_subject_code
                << " elective has an open section.";
    }
  }
  return resolved;
}

std::vector<ResolvedRequirement> ResolveRequirements(
    const SchedulePlannerParameters& parameters, const CourseCatalog& catalog) {
  return ResolveRequirements(parameters.requirements(), catalog,
                             parameters.elective_subject_code());
}

std::vector<CourseSlate> BuildCourseSlates(
    absl::Span<const ResolvedRequirement> requirements) {
  std::vector<CourseSlate> slates(1);
  for (const ResolvedRequirement& requirement : requirements) {
    if (requirement.groups.empty()) return {};
    std::vector<CourseSlate> extended;
    extended.reserve(slates.size() * requirement.groups.size());
    for (const std::vector<const Course*>& group : requirement.groups) {
      for (const CourseSlate& slate : slates) {
        CourseSlate& next = extended.emplace_back(slate);
        next.insert(next.end(), group.begin(), group.end());
      }
    }
    slates = std::move(extended);
  }
  return slates;
}

}  // namespace course_planner
