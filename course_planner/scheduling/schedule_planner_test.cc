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

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "course_planner/base/gmock.h"
#include "course_planner/base/parse_test_proto.h"
#include "course_planner/catalog/course_catalog.h"
#include "course_planner/catalog/meeting_time.h"
#include "course_planner/catalog/section_records.h"
#include "course_planner/scheduling/planner_parameters.pb.h"
#include "course_planner/scheduling/schedule_response.pb.h"
#include "gtest/gtest.h"
#include "google/protobuf/struct.pb.h"

namespace course_planner {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::SizeIs;

constexpr absl::string_view kFeed = R"json([
  {"subject": "CSCI", "subjectCourse": "CSCI1200",
   "courseTitle": "Data Structures", "creditHours": 4,
   "seatsAvailable": 10, "courseReferenceNumber": "40001",
   "meetingsFaculty": [{"meetingTime": {
     "beginTime": "1000", "endTime": "1150", "monday": true,
     "thursday": true}}]},
  {"subject": "CSCI", "subjectCourse": "CSCI1200",
   "courseTitle": "Data Structures", "creditHours": 4,
   "seatsAvailable": 10, "courseReferenceNumber": "40002",
   "meetingsFaculty": [{"meetingTime": {
     "beginTime": "0800", "endTime": "0950", "tuesday": true,
     "friday": true}}]},
  {"subject": "MATH", "subjectCourse": "MATH1020",
   "courseTitle": "Calculus II", "creditHours": 4,
   "seatsAvailable": 10, "courseReferenceNumber": "41001",
   "meetingsFaculty": [{"meetingTime": {
     "beginTime": "1000", "endTime": "1050", "monday": true,
     "wednesday": true, "thursday": true}}]},
  {"subject": "MATH", "subjectCourse": "MATH1020",
   "courseTitle": "Calculus II", "creditHours": 4,
   "seatsAvailable": 10, "courseReferenceNumber": "41002",
   "meetingsFaculty": [{"meetingTime": {
     "beginTime": "1200", "endTime": "1250", "monday": true,
     "wednesday": true, "thursday": true}}]},
  {"subject": "INQR", "subjectCourse": "INQR1010",
   "courseTitle": "Inquiry", "creditHours": 2,
   "seatsAvailable": 10, "courseReferenceNumber": "42001",
   "meetingsFaculty": [{"meetingTime": {
     "beginTime": "1600", "endTime": "1750", "wednesday": true}}]}
])json";

google::protobuf::ListValue Feed() {
  absl::StatusOr<google::protobuf::ListValue> records =
      ParseSectionRecordsJson(kFeed);
  EXPECT_OK(records);
  return records.ok() ? *records : google::protobuf::ListValue();
}

SchedulePlannerParameters CsAndMathParameters() {
  return ParseTestProto(R"pb(
    requirements {
      name: "cs"
      groups { course_codes: "CSCI1200" }
    }
    requirements {
      name: "math"
      groups { course_codes: "MATH1020" }
    }
  )pb");
}

std::vector<std::string> SectionIds(const ScheduleOption& option) {
  std::vector<std::string> ids;
  for (const ScheduledSection& section : option.sections()) {
    ids.push_back(section.id());
  }
  return ids;
}

TEST(ValidateParametersTest, DefaultsAreValid) {
  SchedulePlannerParameters parameters;
  EXPECT_OK(ValidateParameters(parameters));
  EXPECT_OK(ValidateParameters(CsAndMathParameters()));
}

TEST(ValidateParametersTest, RejectsNonPositiveMaxSchedules) {
  SchedulePlannerParameters parameters = CsAndMathParameters();
  parameters.set_max_schedules(0);
  EXPECT_EQ(ValidateParameters(parameters).code(),
            absl::StatusCode::kInvalidArgument);
  parameters.set_max_schedules(-3);
  EXPECT_EQ(ValidateParameters(parameters).code(),
            absl::StatusCode::kInvalidArgument);
}

TEST(ValidateParametersTest, RejectsInvalidRequirements) {
  for (const absl::string_view text : {
           R"pb(requirements { groups { course_codes: "A" } })pb",
           R"pb(requirements {
                  name: "electives"
                  groups { course_codes: "A" }
                })pb",
           R"pb(requirements {
                  name: "a"
                  groups { course_codes: "A" }
                }
                requirements {
                  name: "a"
                  groups { course_codes: "B" }
                })pb",
           R"pb(requirements {
                  name: "a"
                  groups {}
                })pb",
           R"pb(requirements {
                  name: "a"
                  groups { course_codes: "" }
                })pb",
           R"pb(scoring { ideal_active_days_min: 4 ideal_active_days_max: 3 })pb",
           R"pb(scoring { late_class_threshold: 1500 })pb",
           R"pb(min_seats_available: -1)pb",
           R"pb(max_frontier_size: -1)pb",
       }) {
    const SchedulePlannerParameters parameters = ParseTestProto(text);
    EXPECT_EQ(ValidateParameters(parameters).code(),
              absl::StatusCode::kInvalidArgument)
        << text;
  }
}

TEST(RankSchedulesTest, SortsSkipsEmptyAndTruncates) {
  CourseCatalog catalog;
  Course* const course = catalog.FindOrAddCourse("A", "X", "A", 4.0);
  course->AddSection("early", {MeetingTime(Weekday::kMonday, 420, 470)});
  course->AddSection("first", {MeetingTime(Weekday::kMonday, 600, 650)});
  course->AddSection("second", {MeetingTime(Weekday::kTuesday, 600, 650)});
  const absl::Span<const Section> sections = course->sections();

  const ScoringWeights weights;
  const std::vector<ScoredSchedule> ranked = RankSchedules(
      {{&sections[0]}, {}, {&sections[1]}, {&sections[2]}}, weights, {},
      /*max_schedules=*/2);
  ASSERT_THAT(ranked, SizeIs(2));
  EXPECT_EQ(ranked[0].candidate[0]->id(), "first");
  EXPECT_EQ(ranked[1].candidate[0]->id(), "second");
  EXPECT_EQ(ranked[0].score, ranked[1].score);
}

TEST(SchedulePlannerTest, FillsInDefaultRequirements) {
  const SchedulePlanner planner(SchedulePlannerParameters{});
  ASSERT_EQ(planner.parameters().requirements_size(), 3);
  EXPECT_EQ(planner.parameters().requirements(2).groups_size(), 2);
}

TEST(SchedulePlannerTest, InvalidParametersAreReportedFirst) {
  SchedulePlannerParameters parameters = CsAndMathParameters();
  parameters.set_max_schedules(0);
  SchedulePlanner planner(parameters);
  EXPECT_EQ(planner.Solve(Feed()).status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(planner.normalization_stats().records_seen, 0);
}

TEST(SchedulePlannerTest, BuildsRankedOptions) {
  SchedulePlanner planner(CsAndMathParameters());
  ASSERT_OK_AND_ASSIGN(const ScheduleResponse response, planner.Solve(Feed()));

  EXPECT_EQ(response.num_courses(), 3);
  EXPECT_EQ(response.num_sections(), 5);
  EXPECT_EQ(response.num_course_slates(), 1);
  EXPECT_EQ(response.num_candidates(), 3);
  EXPECT_EQ(planner.normalization_stats().sections_added, 5);
  EXPECT_EQ(planner.search_stats().candidates_found, 3);

  ASSERT_THAT(response.options(), SizeIs(3));
  for (int i = 0; i < response.options_size(); ++i) {
    const ScheduleOption& option = response.options(i);
    EXPECT_EQ(option.label(), absl::StrCat("Schedule ", i + 1));
    EXPECT_EQ(option.total_credits(), 10.0);
    ASSERT_THAT(option.sections(), SizeIs(3));
    EXPECT_EQ(option.sections(0).course_code(), "CSCI1200");
    EXPECT_EQ(option.sections(1).course_code(), "MATH1020");
    EXPECT_EQ(option.sections(2).course_code(), "INQR1010");
    if (i > 0) {
      EXPECT_GE(response.options(i - 1).score(), option.score());
    }
  }
  // 40001 and 41001 both meet on Monday at 10:00.
  for (const ScheduleOption& option : response.options()) {
    EXPECT_NE(SectionIds(option),
              std::vector<std::string>({"40001", "41001", "42001"}));
  }
}

TEST(SchedulePlannerTest, ProjectsMeetings) {
  SchedulePlannerParameters parameters = CsAndMathParameters();
  parameters.set_max_schedules(1);
  SchedulePlanner planner(parameters);
  // Forces 40001 to the top.
  planner.AddScoreAdjustment(
      [](absl::Span<const Section* const> schedule) -> absl::StatusOr<double> {
        return schedule[0]->id() == "40001" ? 1000.0 : 0.0;
      });
  ASSERT_OK_AND_ASSIGN(const ScheduleResponse response, planner.Solve(Feed()));
  ASSERT_THAT(response.options(), SizeIs(1));
  const ScheduleOption& option = response.options(0);
  EXPECT_THAT(SectionIds(option), ElementsAre("40001", "41002", "42001"));

  const ScheduledSection& cs = option.sections(0);
  EXPECT_EQ(cs.title(), "Data Structures");
  EXPECT_EQ(cs.credits(), 4.0);
  ASSERT_THAT(cs.meetings(), SizeIs(2));
  EXPECT_EQ(cs.meetings(0).day_name(), "Monday");
  EXPECT_EQ(cs.meetings(0).begin(), "1000");
  EXPECT_EQ(cs.meetings(0).end(), "1150");
  EXPECT_EQ(cs.meetings(1).day_name(), "Thursday");
}

TEST(SchedulePlannerTest, UnsatisfiableRequirementGivesNoOption) {
  SchedulePlannerParameters parameters = CsAndMathParameters();
  Requirement* const physics = parameters.add_requirements();
  physics->set_name("physics");
  physics->add_groups()->add_course_codes("PHYS1100");
  SchedulePlanner planner(parameters);
  ASSERT_OK_AND_ASSIGN(const ScheduleResponse response, planner.Solve(Feed()));
  EXPECT_THAT(response.options(), IsEmpty());
  EXPECT_EQ(response.num_course_slates(), 0);
}

TEST(SchedulePlannerTest, FilteredOutElectivesGiveNoOption) {
  SchedulePlannerParameters parameters = CsAndMathParameters();
  parameters.add_exclude_subjects("INQR");
  SchedulePlanner planner(parameters);
  ASSERT_OK_AND_ASSIGN(const ScheduleResponse response, planner.Solve(Feed()));
  EXPECT_THAT(response.options(), IsEmpty());
  EXPECT_EQ(planner.normalization_stats().records_filtered, 1);
}

TEST(SchedulePlannerTest, WithoutElectiveSubject) {
  SchedulePlannerParameters parameters = CsAndMathParameters();
  parameters.set_elective_subject_code("");
  SchedulePlanner planner(parameters);
  ASSERT_OK_AND_ASSIGN(const ScheduleResponse response, planner.Solve(Feed()));
  ASSERT_THAT(response.options(), SizeIs(3));
  EXPECT_THAT(response.options(0).sections(), SizeIs(2));
  EXPECT_EQ(response.options(0).total_credits(), 8.0);
}

TEST(ResponseToJsonTest, PrintsDefaultValuedFields) {
  const ScheduleResponse response = ParseTestProto(R"pb(
    options { label: "Schedule 1" score: 0 }
  )pb");
  ASSERT_OK_AND_ASSIGN(const std::string json, ResponseToJson(response));
  EXPECT_THAT(json, HasSubstr("\"label\": \"Schedule 1\""));
  EXPECT_THAT(json, HasSubstr("\"score\": 0"));
  EXPECT_THAT(json, HasSubstr("\"num_courses\": 0"));
  EXPECT_THAT(json, HasSubstr("\"num_candidates\""));
  EXPECT_THAT(json, HasSubstr("\"total_credits\""));
}

TEST(SchedulePlannerTest, SolveWithCatalogOnEmptyCatalog) {
  SchedulePlanner planner(CsAndMathParameters());
  const CourseCatalog catalog;
  ASSERT_OK_AND_ASSIGN(const ScheduleResponse response,
                       planner.SolveWithCatalog(catalog));
  EXPECT_THAT(response.options(), IsEmpty());
  EXPECT_EQ(response.num_courses(), 0);
}

}  // namespace
}  // namespace course_planner
