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

#include <cstddef>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "course_planner/catalog/course_catalog.h"
#include "course_planner/catalog/meeting_time.h"
#include "course_planner/scheduling/requirement_resolver.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace course_planner {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::SizeIs;

std::vector<std::string> Ids(const ScheduleCandidate& candidate) {
  std::vector<std::string> ids;
  for (const Section* const section : candidate) ids.push_back(section->id());
  return ids;
}

class SectionCombinationSearchTest : public ::testing::Test {
 protected:
  Course* AddCourse(absl::string_view code) {
    return catalog_.FindOrAddCourse(code, "X", code, 4.0);
  }

  CourseCatalog catalog_;
};

TEST_F(SectionCombinationSearchTest, SkipsConflictingSections) {
  Course* const a = AddCourse("A");
  a->AddSection("A1", {MeetingTime(Weekday::kMonday, 540, 590)});
  Course* const b = AddCourse("B");
  b->AddSection("B1", {MeetingTime(Weekday::kMonday, 570, 620)});
  b->AddSection("B2", {MeetingTime(Weekday::kTuesday, 540, 590)});

  const std::vector<ScheduleCandidate> candidates =
      GenerateSectionCombinations({a, b});
  ASSERT_THAT(candidates, SizeIs(1));
  EXPECT_THAT(Ids(candidates[0]), ElementsAre("A1", "B2"));
}

TEST_F(SectionCombinationSearchTest, SingleSectionCourses) {
  Course* const a = AddCourse("A");
  a->AddSection("A1", {MeetingTime(Weekday::kMonday, 540, 590)});
  Course* const b = AddCourse("B");
  b->AddSection("B1", {MeetingTime(Weekday::kMonday, 590, 640)});

  const std::vector<ScheduleCandidate> candidates =
      GenerateSectionCombinations({a, b});
  ASSERT_THAT(candidates, SizeIs(1));
  EXPECT_THAT(Ids(candidates[0]), ElementsAre("A1", "B1"));
}

TEST_F(SectionCombinationSearchTest, CourseWithoutSectionsHasNoCandidate) {
  Course* const a = AddCourse("A");
  a->AddSection("A1", {MeetingTime(Weekday::kMonday, 540, 590)});
  Course* const b = AddCourse("B");

  SectionCombinationSearch search;
  std::vector<ScheduleCandidate> candidates;
  search.EnumerateSlate({a, b}, &candidates);
  EXPECT_THAT(candidates, IsEmpty());
  EXPECT_EQ(search.stats().slates_pruned, 1);
}

TEST_F(SectionCombinationSearchTest, AllConflictingHasNoCandidate) {
  Course* const a = AddCourse("A");
  a->AddSection("A1", {MeetingTime(Weekday::kFriday, 600, 700)});
  a->AddSection("A2", {MeetingTime(Weekday::kFriday, 800, 900)});
  Course* const b = AddCourse("B");
  b->AddSection("B1", {MeetingTime(Weekday::kFriday, 650, 850)});
  Course* const c = AddCourse("C");
  c->AddSection("C1", {MeetingTime(Weekday::kMonday, 600, 700)});

  SectionCombinationSearch search;
  std::vector<ScheduleCandidate> candidates;
  search.EnumerateSlate({c, a, b}, &candidates);
  EXPECT_THAT(candidates, IsEmpty());
  EXPECT_EQ(search.stats().slates_examined, 1);
  EXPECT_EQ(search.stats().slates_pruned, 1);
  EXPECT_EQ(search.stats().candidates_found, 0);
}

TEST_F(SectionCombinationSearchTest, EnumeratesEveryCompatibleAssignment) {
  Course* const a = AddCourse("A");
  a->AddSection("A1", {MeetingTime(Weekday::kMonday, 540, 590)});
  a->AddSection("A2", {MeetingTime(Weekday::kMonday, 600, 650)});
  Course* const b = AddCourse("B");
  b->AddSection("B1", {MeetingTime(Weekday::kTuesday, 540, 590)});
  b->AddSection("B2", {MeetingTime(Weekday::kMonday, 540, 590)});
  b->AddSection("B3", {MeetingTime(Weekday::kWednesday, 540, 590)});

  const std::vector<ScheduleCandidate> candidates =
      GenerateSectionCombinations({a, b});
  // Sections of the later course vary slowest.
  ASSERT_THAT(candidates, SizeIs(5));
  EXPECT_THAT(Ids(candidates[0]), ElementsAre("A1", "B1"));
  EXPECT_THAT(Ids(candidates[1]), ElementsAre("A2", "B1"));
  EXPECT_THAT(Ids(candidates[2]), ElementsAre("A2", "B2"));
  EXPECT_THAT(Ids(candidates[3]), ElementsAre("A1", "B3"));
  EXPECT_THAT(Ids(candidates[4]), ElementsAre("A2", "B3"));
  for (const ScheduleCandidate& candidate : candidates) {
    for (size_t i = 0; i < candidate.size(); ++i) {
      for (size_t j = i + 1; j < candidate.size(); ++j) {
        EXPECT_FALSE(candidate[i]->ConflictsWith(*candidate[j]));
      }
    }
  }
}

TEST_F(SectionCombinationSearchTest, FrontierCap) {
  Course* const a = AddCourse("A");
  a->AddSection("A1", {MeetingTime(Weekday::kMonday, 540, 590)});
  a->AddSection("A2", {MeetingTime(Weekday::kTuesday, 540, 590)});
  a->AddSection("A3", {MeetingTime(Weekday::kWednesday, 540, 590)});
  Course* const b = AddCourse("B");
  b->AddSection("B1", {MeetingTime(Weekday::kThursday, 540, 590)});

  SectionCombinationSearch search(/*max_frontier_size=*/2);
  std::vector<ScheduleCandidate> candidates;
  search.EnumerateSlate({a, b}, &candidates);
  ASSERT_THAT(candidates, SizeIs(2));
  EXPECT_THAT(Ids(candidates[0]), ElementsAre("A1", "B1"));
  EXPECT_THAT(Ids(candidates[1]), ElementsAre("A2", "B1"));
  EXPECT_EQ(search.stats().frontier_truncations, 1);
}

TEST_F(SectionCombinationSearchTest, EnumerateAllConcatenatesSlates) {
  Course* const a = AddCourse("A");
  a->AddSection("A1", {MeetingTime(Weekday::kMonday, 540, 590)});
  Course* const b = AddCourse("B");
  b->AddSection("B1", {MeetingTime(Weekday::kMonday, 540, 590)});
  Course* const c = AddCourse("C");
  c->AddSection("C1", {MeetingTime(Weekday::kTuesday, 540, 590)});

  const std::vector<CourseSlate> slates = {{a, b}, {a, c}, {b, c}};
  SectionCombinationSearch search;
  const std::vector<ScheduleCandidate> candidates =
      search.EnumerateAll(slates);
  ASSERT_THAT(candidates, SizeIs(2));
  EXPECT_THAT(Ids(candidates[0]), ElementsAre("A1", "C1"));
  EXPECT_THAT(Ids(candidates[1]), ElementsAre("B1", "C1"));
  EXPECT_EQ(search.stats().slates_examined, 3);
  EXPECT_EQ(search.stats().slates_pruned, 1);
  EXPECT_EQ(search.stats().candidates_found, 2);
}

}  // namespace
}  // namespace course_planner
