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

// Loading of the raw section feed and typed accessors on its loosely
// structured records.

#ifndef COURSE_PLANNER_CATALOG_SECTION_RECORDS_H_
#define COURSE_PLANNER_CATALOG_SECTION_RECORDS_H_

#include <optional>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/struct.pb.h"

namespace course_planner {

// Field names of the Banner registration feed.
inline constexpr absl::string_view kSubjectField = "subject";
inline constexpr absl::string_view kCourseCodeField = "subjectCourse";
inline constexpr absl::string_view kCourseTitleField = "courseTitle";
inline constexpr absl::string_view kCreditHoursField = "creditHours";
inline constexpr absl::string_view kSeatsAvailableField = "seatsAvailable";
inline constexpr absl::string_view kReferenceNumberField =
    "courseReferenceNumber";
inline constexpr absl::string_view kMeetingsField = "meetingsFaculty";
inline constexpr absl::string_view kMeetingTimeField = "meetingTime";
inline constexpr absl::string_view kBeginTimeField = "beginTime";
inline constexpr absl::string_view kEndTimeField = "endTime";
inline constexpr absl::string_view kCreditHourSessionField =
    "creditHourSession";
inline constexpr absl::string_view kStartDateField = "startDate";
inline constexpr absl::string_view kEndDateField = "endDate";
inline constexpr absl::string_view kBuildingField = "building";
inline constexpr absl::string_view kBuildingDescriptionField =
    "buildingDescription";
inline constexpr absl::string_view kRoomField = "room";

// Day flags of a meeting block, Monday first.
inline constexpr absl::string_view kDayFlagFields[] = {
    "monday", "tuesday", "wednesday", "thursday", "friday"};

// Parses a JSON array of section records.
absl::StatusOr<google::protobuf::ListValue> ParseSectionRecordsJson(
    absl::string_view json);

// Returns nullptr if the field is absent.
const google::protobuf::Value* FindField(const google::protobuf::Struct& record,
                                         absl::string_view name);

// Returns nullptr if the field is absent or is not an object.
const google::protobuf::Struct* FindStructField(
    const google::protobuf::Struct& record, absl::string_view name);

// Returns nullptr if the field is absent or is not an array.
const google::protobuf::ListValue* FindListField(
    const google::protobuf::Struct& record, absl::string_view name);

// Numbers are returned as is, strings are parsed. Anything else, including an
// unparsable or non-finite value, is std::nullopt.
std::optional<double> ValueAsNumber(const google::protobuf::Value& value);

// Strings are returned as is, integral numbers without a fractional part.
// Null, objects and arrays give an empty string.
std::string ValueAsString(const google::protobuf::Value& value);

// JSON truthiness: true, a non-zero number, or a non-empty string.
bool ValueIsTruthy(const google::protobuf::Value& value);

// Convenience wrappers that treat an absent field like a null value.
std::optional<double> FieldAsNumber(const google::protobuf::Struct& record,
                                    absl::string_view name);
std::string FieldAsString(const google::protobuf::Struct& record,
                          absl::string_view name);

}  // namespace course_planner

#endif  // COURSE_PLANNER_CATALOG_SECTION_RECORDS_H_
