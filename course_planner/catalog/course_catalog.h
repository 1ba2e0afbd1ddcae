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

#ifndef COURSE_PLANNER_CATALOG_COURSE_CATALOG_H_
#define COURSE_PLANNER_CATALOG_COURSE_CATALOG_H_

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "course_planner/catalog/meeting_time.h"

namespace course_planner {

class Course;

// One offered instance of a course, with its own weekly meetings. Sections are
// owned by their Course and never outlive it.
class Section {
 public:
  Section(std::string id, std::vector<MeetingTime> meeting_times,
          const Course* course)
      : id_(std::move(id)),
        meeting_times_(std::move(meeting_times)),
        course_(course) {}

  // Registration reference number.
  const std::string& id() const { return id_; }
  absl::Span<const MeetingTime> meeting_times() const { return meeting_times_; }

  // The owning course. Only used for labels.
  const Course& course() const { return *course_; }

  // True iff any meeting of this section overlaps any meeting of `other`.
  bool ConflictsWith(const Section& other) const;

  std::string DebugString() const;

 private:
  std::string id_;
  std::vector<MeetingTime> meeting_times_;
  const Course* course_;
};

// A subject+number course (e.g. "CSCI1200") aggregating its sections.
// Courses are not copyable since their sections point back to them.
class Course {
 public:
  Course(std::string subject, std::string code, std::string title,
         double credits)
      : subject_(std::move(subject)),
        code_(std::move(code)),
        title_(std::move(title)),
        credits_(credits) {}

  Course(const Course&) = delete;
  Course& operator=(const Course&) = delete;

  const std::string& subject() const { return subject_; }
  const std::string& code() const { return code_; }
  const std::string& title() const { return title_; }
  double credits() const { return credits_; }

  // Appends a section. `meeting_times` must not be empty. The returned
  // reference is invalidated by the next call.
  const Section& AddSection(std::string id,
                            std::vector<MeetingTime> meeting_times);

  absl::Span<const Section> sections() const { return sections_; }
  bool has_sections() const { return !sections_.empty(); }

  std::string DebugString() const;

 private:
  std::string subject_;
  std::string code_;
  std::string title_;
  double credits_;
  std::vector<Section> sections_;
};

// Arena of courses keyed by code, in the order in which they were first
// encountered. All the pointers handed out stay valid for the lifetime of the
// catalog.
class CourseCatalog {
 public:
  CourseCatalog() = default;
  CourseCatalog(const CourseCatalog&) = delete;
  CourseCatalog& operator=(const CourseCatalog&) = delete;

  // Returns the course with the given code, creating it with the given
  // attributes if it does not exist yet. The attributes of an existing course
  // are left untouched.
  Course* FindOrAddCourse(absl::string_view code, absl::string_view subject,
                          absl::string_view title, double credits);

  // Returns nullptr if no course has this code.
  const Course* FindCourse(absl::string_view code) const;
  Course* FindMutableCourse(absl::string_view code);

  // Courses in encounter order.
  const std::vector<std::unique_ptr<Course>>& courses() const {
    return courses_;
  }

  int num_courses() const { return static_cast<int>(courses_.size()); }
  int64_t num_sections() const;

 private:
  std::vector<std::unique_ptr<Course>> courses_;
  absl::flat_hash_map<std::string, Course*> course_by_code_;
};

}  // namespace course_planner

#endif  // COURSE_PLANNER_CATALOG_COURSE_CATALOG_H_
