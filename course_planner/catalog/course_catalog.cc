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

#include "course_planner/catalog/course_catalog.h"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "course_planner/base/logging.h"
#include "course_planner/catalog/meeting_time.h"

namespace course_planner {

bool Section::ConflictsWith(const Section& other) const {
  for (const MeetingTime& mine : meeting_times_) {
    for (const MeetingTime& theirs : other.meeting_times_) {
      if (mine.Overlaps(theirs)) return true;
    }
  }
  return false;
}

std::string Section::DebugString() const {
  return absl::StrCat(
      "Section(", id_, ", course=", course_->code(), ", times=[",
      absl::StrJoin(meeting_times_, ", ",
                    [](std::string* out, const MeetingTime& meeting) {
                      absl::StrAppend(out, meeting.DebugString());
                    }),
      "])");
}

const Section& Course::AddSection(std::string id,
                                  std::vector<MeetingTime> meeting_times) {
  DCHECK(!meeting_times.empty()) << code_ << " " << id;
  sections_.emplace_back(std::move(id), std::move(meeting_times), this);
  return sections_.back();
}

std::string Course::DebugString() const {
  return absl::StrCat("Course(", code_, ", title=", title_,
                      ", credits=", credits_, ", sections=", sections_.size(),
                      ")");
}

Course* CourseCatalog::FindOrAddCourse(absl::string_view code,
                                       absl::string_view subject,
                                       absl::string_view title,
                                       double credits) {
  Course* const existing = FindMutableCourse(code);
  if (existing != nullptr) return existing;
  courses_.push_back(std::make_unique<Course>(
      std::string(subject), std::string(code), std::string(title), credits));
  Course* const course = courses_.back().get();
  course_by_code_.emplace(course->code(), course);
  return course;
}

const Course* CourseCatalog::FindCourse(absl::string_view code) const {
  const auto it = course_by_code_.find(code);
  return it == course_by_code_.end() ? nullptr : it->second;
}

Course* CourseCatalog::FindMutableCourse(absl::string_view code) {
  const auto it = course_by_code_.find(code);
  return it == course_by_code_.end() ? nullptr : it->second;
}

int64_t CourseCatalog::num_sections() const {
  int64_t total = 0;
  for (const std::unique_ptr<Course>& course : courses_) {
    total += course->sections().size();
  }
  return total;
}

}  // namespace course_planner
