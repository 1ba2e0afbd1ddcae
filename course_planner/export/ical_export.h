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

// Export of planned schedules as iCalendar (RFC 5545) files.
//
// Each weekly meeting of a schedule becomes one recurring event that starts on
// the first occurrence of its weekday on or after the start of the term, and
// repeats weekly until the last occurrence on or before the end of the term.
// The export only reads ScheduleOption values and never changes them.

#ifndef COURSE_PLANNER_EXPORT_ICAL_EXPORT_H_
#define COURSE_PLANNER_EXPORT_ICAL_EXPORT_H_

#include <optional>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/civil_time.h"
#include "absl/time/time.h"
#include "course_planner/scheduling/schedule_response.pb.h"
#include "google/protobuf/struct.pb.h"

namespace course_planner {

inline constexpr absl::string_view kDefaultTimezone = "America/New_York";

// Dates and location of a section, as found in the raw feed.
struct SectionMetadata {
  std::optional<absl::CivilDay> start_date;
  std::optional<absl::CivilDay> end_date;
  std::string location;
};

// Keyed by section id (registration reference number).
using SectionMetadataMap = absl::flat_hash_map<std::string, SectionMetadata>;

struct TermBounds {
  std::optional<absl::CivilDay> start;
  std::optional<absl::CivilDay> end;
};

// Parses "YYYY-MM-DD".
absl::StatusOr<absl::CivilDay> ParseIsoDate(absl::string_view text);

// Parses the "MM/DD/YYYY" dates of the feed. Returns std::nullopt on any
// malformed or out-of-range date.
std::optional<absl::CivilDay> ParseFeedDate(absl::string_view text);

// Reads the dates and location of every section of the feed. The first meeting
// block with a begin time is used, or the first block if none has one.
SectionMetadataMap CollectSectionMetadata(
    const google::protobuf::ListValue& records);

// The earliest start date and the latest end date among the sections of the
// response. Either bound is absent when no such section has one.
TermBounds DeriveTermBounds(const ScheduleResponse& response,
                            const SectionMetadataMap& metadata);

absl::CivilDay NextWeekdayOnOrAfter(absl::CivilDay day, absl::Weekday weekday);
absl::CivilDay LastWeekdayOnOrBefore(absl::CivilDay day, absl::Weekday weekday);

// Renders one schedule as a VCALENDAR with CRLF line endings. `now` is the
// DTSTAMP of the events. Fails if a meeting of the option has an unknown day
// name or a malformed time, or if the term ends before it starts.
absl::StatusOr<std::string> BuildCalendar(const ScheduleOption& option,
                                          absl::CivilDay term_start,
                                          absl::CivilDay term_end,
                                          absl::string_view timezone,
                                          const SectionMetadataMap& metadata,
                                          absl::Time now);

// "Schedule 1" -> "schedule_1.ics".
std::string CalendarFileName(absl::string_view label);

}  // namespace course_planner

#endif  // COURSE_PLANNER_EXPORT_ICAL_EXPORT_H_
