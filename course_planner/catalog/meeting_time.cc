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

#include "course_planner/catalog/meeting_time.h"

#include <ostream>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"

namespace course_planner {
namespace {

constexpr absl::string_view kDayNames[kNumWeekdays] = {
    "Monday", "Tuesday", "Wednesday", "Thursday", "Friday"};
constexpr absl::string_view kDayShortNames[kNumWeekdays] = {"Mon", "Tue", "Wed",
                                                            "Thu", "Fri"};

}  // namespace

absl::string_view WeekdayName(Weekday day) {
  return kDayNames[WeekdayIndex(day)];
}

absl::string_view WeekdayShortName(Weekday day) {
  return kDayShortNames[WeekdayIndex(day)];
}

absl::StatusOr<Weekday> ParseWeekdayName(absl::string_view name) {
  const absl::string_view stripped = absl::StripAsciiWhitespace(name);
  for (int i = 0; i < kNumWeekdays; ++i) {
    if (absl::EqualsIgnoreCase(stripped, kDayNames[i])) {
      return static_cast<Weekday>(i);
    }
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Unknown day name: '", name, "'"));
}

absl::StatusOr<int> ParseHhmm(absl::string_view hhmm) {
  if (hhmm.size() != 4) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid time format: '", hhmm, "'"));
  }
  for (const char c : hhmm) {
    if (!absl::ascii_isdigit(c)) {
      return absl::InvalidArgumentError(
          absl::StrCat("Invalid time format: '", hhmm, "'"));
    }
  }
  int hours = 0;
  int minutes = 0;
  if (!absl::SimpleAtoi(hhmm.substr(0, 2), &hours) ||
      !absl::SimpleAtoi(hhmm.substr(2, 2), &minutes)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid time format: '", hhmm, "'"));
  }
  if (hours >= 24 || minutes >= 60) {
    return absl::InvalidArgumentError(
        absl::StrCat("Time out of range: '", hhmm, "'"));
  }
  return hours * 60 + minutes;
}

std::string FormatHhmm(int minutes) {
  return absl::StrFormat("%02d%02d", minutes / 60, minutes % 60);
}

std::string FormatClockTime(int minutes) {
  return absl::StrFormat("%02d:%02d", minutes / 60, minutes % 60);
}

std::string MeetingTime::DebugString() const {
  return absl::StrCat(WeekdayShortName(day_), " ", FormatClockTime(begin_),
                      "-", FormatClockTime(end_));
}

std::ostream& operator<<(std::ostream& out, const MeetingTime& meeting) {
  return out << meeting.DebugString();
}

}  // namespace course_planner
