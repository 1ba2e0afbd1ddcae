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

#include "course_planner/export/ical_export.h"

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/time/civil_time.h"
#include "absl/time/time.h"
#include "course_planner/base/status_macros.h"
#include "course_planner/catalog/meeting_time.h"
#include "course_planner/catalog/section_records.h"
#include "course_planner/scheduling/schedule_response.pb.h"
#include "google/protobuf/struct.pb.h"

namespace course_planner {
namespace {

constexpr absl::string_view kRruleDays[kNumWeekdays] = {"MO", "TU", "WE", "TH",
                                                        "FR"};

absl::Weekday ToCivilWeekday(Weekday day) {
  // absl::Weekday also starts on Monday.
  return static_cast<absl::Weekday>(WeekdayIndex(day));
}

int DaysSinceMonday(absl::Weekday weekday) {
  return static_cast<int>(weekday);
}

// "20260112T093000".
std::string FormatLocalDateTime(absl::CivilDay day, int minutes) {
  return absl::StrFormat("%04d%02d%02dT%02d%02d00", day.year(), day.month(),
                         day.day(), minutes / 60, minutes % 60);
}

// Escapes a TEXT property value.
std::string EscapeText(absl::string_view text) {
  return absl::StrReplaceAll(
      text, {{"\\", "\\\\"}, {";", "\\;"}, {",", "\\,"}, {"\n", "\\n"}});
}

std::string MakeUid(absl::string_view label, const ScheduledSection& section,
                    const MeetingSlot& meeting) {
  std::string seed = absl::StrJoin(
      {label, absl::string_view(section.id()),
       absl::string_view(meeting.day_name()), absl::string_view(meeting.begin()),
       absl::string_view(meeting.end())},
      "-");
  absl::AsciiStrToLower(&seed);
  absl::StrReplaceAll({{" ", "_"}}, &seed);
  return absl::StrCat(seed, "@course-planner");
}

// The "meetingTime" object used for the dates and the location of a record.
const google::protobuf::Struct* MetadataBlock(
    const google::protobuf::Struct& record) {
  const google::protobuf::ListValue* const blocks =
      FindListField(record, kMeetingsField);
  if (blocks == nullptr) return nullptr;
  const google::protobuf::Struct* first = nullptr;
  for (int i = 0; i < blocks->values_size(); ++i) {
    const google::protobuf::Value& block = blocks->values(i);
    if (block.kind_case() != google::protobuf::Value::kStructValue) continue;
    const google::protobuf::Struct* const meeting_time =
        FindStructField(block.struct_value(), kMeetingTimeField);
    if (meeting_time == nullptr) continue;
    const google::protobuf::Value* const begin =
        FindField(*meeting_time, kBeginTimeField);
    if (begin != nullptr && ValueIsTruthy(*begin)) return meeting_time;
    if (i == 0) first = meeting_time;
  }
  return first;
}

absl::Status AppendEventLines(absl::string_view label,
                              const ScheduledSection& section,
                              const MeetingSlot& meeting,
                              absl::CivilDay term_start,
                              absl::CivilDay term_end,
                              absl::string_view timezone,
                              const SectionMetadataMap& metadata,
                              absl::string_view dtstamp,
                              std::vector<std::string>* lines) {
  ASSIGN_OR_RETURN(const Weekday day, ParseWeekdayName(meeting.day_name()));
  ASSIGN_OR_RETURN(const int begin, ParseHhmm(meeting.begin()));
  ASSIGN_OR_RETURN(const int end, ParseHhmm(meeting.end()));

  const absl::Weekday weekday = ToCivilWeekday(day);
  const absl::CivilDay first_day = NextWeekdayOnOrAfter(term_start, weekday);
  const absl::CivilDay last_day =
      std::max(first_day, LastWeekdayOnOrBefore(term_end, weekday));

  const std::string id(absl::StripAsciiWhitespace(section.id()));
  const std::string summary(absl::StripAsciiWhitespace(absl::StrCat(
      absl::StripAsciiWhitespace(section.course_code()), " ",
      absl::StripAsciiWhitespace(section.title()))));

  lines->push_back("BEGIN:VEVENT");
  lines->push_back(absl::StrCat("UID:", MakeUid(label, section, meeting)));
  lines->push_back(absl::StrCat("SUMMARY:", EscapeText(summary)));
  lines->push_back(absl::StrCat("DTSTAMP:", dtstamp));
  lines->push_back(absl::StrCat("DTSTART;TZID=", timezone, ":",
                                FormatLocalDateTime(first_day, begin)));
  lines->push_back(absl::StrCat("DTEND;TZID=", timezone, ":",
                                FormatLocalDateTime(first_day, end)));
  lines->push_back(absl::StrCat("RRULE:FREQ=WEEKLY;BYDAY=",
                                kRruleDays[WeekdayIndex(day)], ";UNTIL=",
                                FormatLocalDateTime(last_day, end)));
  const auto it = metadata.find(id);
  if (it != metadata.end() && !it->second.location.empty()) {
    lines->push_back(
        absl::StrCat("LOCATION:", EscapeText(it->second.location)));
  }
  if (!id.empty()) {
    lines->push_back(absl::StrCat("DESCRIPTION:CRN: ", EscapeText(id)));
  }
  lines->push_back("END:VEVENT");
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<absl::CivilDay> ParseIsoDate(absl::string_view text) {
  absl::CivilDay day;
  if (!absl::ParseCivilTime(absl::StripAsciiWhitespace(text), &day)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid date '", text, "', expected YYYY-MM-DD"));
  }
  return day;
}

std::optional<absl::CivilDay> ParseFeedDate(absl::string_view text) {
  const std::vector<absl::string_view> parts =
      absl::StrSplit(absl::StripAsciiWhitespace(text), '/');
  if (parts.size() != 3) return std::nullopt;
  int month = 0;
  int day = 0;
  int year = 0;
  if (!absl::SimpleAtoi(parts[0], &month) ||
      !absl::SimpleAtoi(parts[1], &day) || !absl::SimpleAtoi(parts[2], &year)) {
    return std::nullopt;
  }
  const absl::CivilDay date(year, month, day);
  // CivilDay normalizes out-of-range fields, e.g. 02/30 into March.
  if (date.year() != year || date.month() != month || date.day() != day) {
    return std::nullopt;
  }
  return date;
}

SectionMetadataMap CollectSectionMetadata(
    const google::protobuf::ListValue& records) {
  SectionMetadataMap metadata;
  for (const google::protobuf::Value& value : records.values()) {
    if (value.kind_case() != google::protobuf::Value::kStructValue) continue;
    const google::protobuf::Struct& record = value.struct_value();
    const std::string id(absl::StripAsciiWhitespace(
        FieldAsString(record, kReferenceNumberField)));
    if (id.empty()) continue;

    SectionMetadata& section = metadata[id];
    const google::protobuf::Struct* const block = MetadataBlock(record);
    if (block == nullptr) continue;
    section.start_date = ParseFeedDate(FieldAsString(*block, kStartDateField));
    section.end_date = ParseFeedDate(FieldAsString(*block, kEndDateField));
    std::string building = FieldAsString(*block, kBuildingDescriptionField);
    if (building.empty()) building = FieldAsString(*block, kBuildingField);
    const std::string room = FieldAsString(*block, kRoomField);
    if (building.empty() || room.empty()) {
      section.location = absl::StrCat(building, room);
    } else {
      section.location = absl::StrCat(building, " ", room);
    }
  }
  return metadata;
}

TermBounds DeriveTermBounds(const ScheduleResponse& response,
                            const SectionMetadataMap& metadata) {
  TermBounds bounds;
  for (const ScheduleOption& option : response.options()) {
    for (const ScheduledSection& section : option.sections()) {
      const auto it = metadata.find(section.id());
      if (it == metadata.end()) continue;
      const SectionMetadata& known = it->second;
      if (known.start_date.has_value() &&
          (!bounds.start.has_value() || *known.start_date < *bounds.start)) {
        bounds.start = known.start_date;
      }
      if (known.end_date.has_value() &&
          (!bounds.end.has_value() || *known.end_date > *bounds.end)) {
        bounds.end = known.end_date;
      }
    }
  }
  return bounds;
}

absl::CivilDay NextWeekdayOnOrAfter(absl::CivilDay day,
                                    absl::Weekday weekday) {
  const int delta =
      (DaysSinceMonday(weekday) - DaysSinceMonday(absl::GetWeekday(day)) + 7) %
      7;
  return day + delta;
}

absl::CivilDay LastWeekdayOnOrBefore(absl::CivilDay day,
                                     absl::Weekday weekday) {
  const int delta =
      (DaysSinceMonday(absl::GetWeekday(day)) - DaysSinceMonday(weekday) + 7) %
      7;
  return day - delta;
}

absl::StatusOr<std::string> BuildCalendar(const ScheduleOption& option,
                                          absl::CivilDay term_start,
                                          absl::CivilDay term_end,
                                          absl::string_view timezone,
                                          const SectionMetadataMap& metadata,
                                          absl::Time now) {
  if (term_end < term_start) {
    return absl::InvalidArgumentError(
        absl::StrCat("The term ends (", absl::FormatCivilTime(term_end),
                     ") before it starts (", absl::FormatCivilTime(term_start),
                     ")."));
  }
  const std::string dtstamp =
      absl::FormatTime("%Y%m%dT%H%M%SZ", now, absl::UTCTimeZone());
  std::vector<std::string> lines = {
      "BEGIN:VCALENDAR",
      "VERSION:2.0",
      "PRODID:-//Course Planner//Schedule Export//EN",
      absl::StrCat("X-WR-CALNAME:", EscapeText(option.label())),
  };
  for (const ScheduledSection& section : option.sections()) {
    for (const MeetingSlot& meeting : section.meetings()) {
      RETURN_IF_ERROR(AppendEventLines(option.label(), section, meeting,
                                       term_start, term_end, timezone,
                                       metadata, dtstamp, &lines))
          << "in section " << section.id() << " of " << option.label();
    }
  }
  lines.push_back("END:VCALENDAR");
  return absl::StrCat(absl::StrJoin(lines, "\r\n"), "\r\n");
}

std::string CalendarFileName(absl::string_view label) {
  std::string name = absl::AsciiStrToLower(label);
  absl::StrReplaceAll({{" ", "_"}}, &name);
  return absl::StrCat(name, ".ics");
}

}  // namespace course_planner
