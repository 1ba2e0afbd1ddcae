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

#include "course_planner/catalog/catalog_normalizer.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "course_planner/base/logging.h"
#include "course_planner/base/status_macros.h"
#include "course_planner/catalog/course_catalog.h"
#include "course_planner/catalog/meeting_time.h"
#include "course_planner/catalog/section_records.h"
#include "google/protobuf/struct.pb.h"

namespace course_planner {
namespace {

// Returns the "meetingTime" object of an element of "meetingsFaculty", or
// nullptr when the element is null or has no such object.
const google::protobuf::Struct* MeetingTimeOfBlock(
    const google::protobuf::Value& block) {
  if (block.kind_case() != google::protobuf::Value::kStructValue) {
    return nullptr;
  }
  return FindStructField(block.struct_value(), kMeetingTimeField);
}

absl::StatusOr<int> ParseBlockTime(const google::protobuf::Struct& meeting_time,
                                   absl::string_view field) {
  const google::protobuf::Value* const value = FindField(meeting_time, field);
  if (value == nullptr ||
      value->kind_case() != google::protobuf::Value::kStringValue ||
      value->string_value().empty()) {
    return absl::InvalidArgumentError(absl::StrCat("Missing ", field));
  }
  return ParseHhmm(value->string_value());
}

}  // namespace

std::string NormalizationStats::DebugString() const {
  return absl::StrCat("records_seen: ", records_seen,
                      " records_filtered: ", records_filtered,
                      " records_malformed: ", records_malformed,
                      " sections_added: ", sections_added,
                      " sections_dropped: ", sections_dropped,
                      " meeting_blocks_skipped: ", meeting_blocks_skipped);
}

double ComputeSectionCredits(const google::protobuf::Struct& record) {
  const double credit_hours =
      FieldAsNumber(record, kCreditHoursField).value_or(0.0);
  if (credit_hours != 0.0) return credit_hours;

  double total = 0.0;
  const google::protobuf::ListValue* const blocks =
      FindListField(record, kMeetingsField);
  if (blocks == nullptr) return total;
  for (const google::protobuf::Value& block : blocks->values()) {
    const google::protobuf::Struct* const meeting_time =
        MeetingTimeOfBlock(block);
    if (meeting_time == nullptr) continue;
    total +=
        FieldAsNumber(*meeting_time, kCreditHourSessionField).value_or(0.0);
  }
  return total;
}

absl::StatusOr<std::vector<MeetingTime>> ParseMeetingBlock(
    const google::protobuf::Struct& meeting_time) {
  ASSIGN_OR_RETURN(const int begin,
                   ParseBlockTime(meeting_time, kBeginTimeField));
  ASSIGN_OR_RETURN(const int end, ParseBlockTime(meeting_time, kEndTimeField));
  if (begin >= end) {
    return absl::InvalidArgumentError(
        absl::StrCat("Non-positive duration: ", FormatHhmm(begin), "-",
                     FormatHhmm(end)));
  }
  std::vector<MeetingTime> meetings;
  for (int day = 0; day < kNumWeekdays; ++day) {
    const google::protobuf::Value* const flag =
        FindField(meeting_time, kDayFlagFields[day]);
    if (flag != nullptr && ValueIsTruthy(*flag)) {
      meetings.emplace_back(static_cast<Weekday>(day), begin, end);
    }
  }
  return meetings;
}

std::vector<MeetingTime> ExtractMeetingTimes(
    const google::protobuf::Struct& record, int64_t* num_skipped_blocks) {
  std::vector<MeetingTime> meetings;
  const google::protobuf::ListValue* const blocks =
      FindListField(record, kMeetingsField);
  if (blocks == nullptr) return meetings;
  for (const google::protobuf::Value& block : blocks->values()) {
    const google::protobuf::Struct* const meeting_time =
        MeetingTimeOfBlock(block);
    if (meeting_time == nullptr) {
      if (num_skipped_blocks != nullptr) ++*num_skipped_blocks;
      continue;
    }
    absl::StatusOr<std::vector<MeetingTime>> parsed =
        ParseMeetingBlock(*meeting_time);
    if (!parsed.ok()) {
      VLOG(1) << "Skipping meeting block: " << parsed.status().message();
      if (num_skipped_blocks != nullptr) ++*num_skipped_blocks;
      continue;
    }
    meetings.insert(meetings.end(), parsed->begin(), parsed->end());
  }
  return meetings;
}

bool CatalogNormalizer::IsAdmitted(
    const google::protobuf::Struct& record) const {
  const double seats =
      FieldAsNumber(record, kSeatsAvailableField).value_or(0.0);
  if (seats < filter_.min_seats_available) return false;

  const std::string subject = FieldAsString(record, kSubjectField);
  if (!filter_.include_subjects.empty() &&
      !filter_.include_subjects.contains(subject)) {
    return false;
  }
  if (filter_.exclude_subjects.contains(subject)) return false;
  return true;
}

void CatalogNormalizer::AddRecord(const google::protobuf::Struct& record,
                                  CourseCatalog* catalog) {
  ++stats_.records_seen;
  if (!IsAdmitted(record)) {
    ++stats_.records_filtered;
    return;
  }

  const std::string code = FieldAsString(record, kCourseCodeField);
  if (code.empty()) {
    VLOG(1) << "Skipping record without " << kCourseCodeField;
    ++stats_.records_malformed;
    return;
  }

  Course* const course = catalog->FindOrAddCourse(
      code, FieldAsString(record, kSubjectField),
      FieldAsString(record, kCourseTitleField),
      ComputeSectionCredits(record));

  const std::string id = std::string(absl::StripAsciiWhitespace(
      FieldAsString(record, kReferenceNumberField)));
  std::vector<MeetingTime> meetings =
      ExtractMeetingTimes(record, &stats_.meeting_blocks_skipped);
  if (meetings.empty()) {
    VLOG(1) << "Skipping section " << id << " for " << code
            << " due to missing meeting times";
    ++stats_.sections_dropped;
    return;
  }
  course->AddSection(id, std::move(meetings));
  ++stats_.sections_added;
}

void CatalogNormalizer::AddRecords(const google::protobuf::ListValue& records,
                                   CourseCatalog* catalog) {
  for (const google::protobuf::Value& record : records.values()) {
    if (record.kind_case() != google::protobuf::Value::kStructValue) {
      ++stats_.records_seen;
      ++stats_.records_malformed;
      VLOG(1) << "Skipping section record that is not an object";
      continue;
    }
    AddRecord(record.struct_value(), catalog);
  }
}

}  // namespace course_planner
