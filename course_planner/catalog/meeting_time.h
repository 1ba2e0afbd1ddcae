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

#ifndef COURSE_PLANNER_CATALOG_MEETING_TIME_H_
#define COURSE_PLANNER_CATALOG_MEETING_TIME_H_

#include <ostream>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "course_planner/base/logging.h"

namespace course_planner {

// Weekdays on which classes can meet. The numeric values are used as indices
// into per-day arrays.
enum class Weekday : int {
  kMonday = 0,
  kTuesday = 1,
  kWednesday = 2,
  kThursday = 3,
  kFriday = 4,
};

inline constexpr int kNumWeekdays = 5;

inline int WeekdayIndex(Weekday day) { return static_cast<int>(day); }

// "Monday", ..., "Friday".
absl::string_view WeekdayName(Weekday day);

// "Mon", ..., "Fri".
absl::string_view WeekdayShortName(Weekday day);

// Parses a full day name, ignoring case and surrounding whitespace.
absl::StatusOr<Weekday> ParseWeekdayName(absl::string_view name);

// Converts a 24-hour "HHMM" string ("0930") to minutes since midnight.
// Exactly four digits are accepted, with HH < 24 and MM < 60.
absl::StatusOr<int> ParseHhmm(absl::string_view hhmm);

// Minutes since midnight to "HHMM".
std::string FormatHhmm(int minutes);

// Minutes since midnight to "HH:MM".
std::string FormatClockTime(int minutes);

// One weekly recurring meeting of a section on a single day, as a half-open
// [begin, end) interval in minutes since midnight.
class MeetingTime {
 public:
  MeetingTime(Weekday day, int begin, int end)
      : day_(day), begin_(begin), end_(end) {
    DCHECK_LT(begin, end);
  }

  Weekday day() const { return day_; }
  int begin() const { return begin_; }
  int end() const { return end_; }
  int duration() const { return end_ - begin_; }

  // Two meetings overlap iff they are on the same day and their half-open
  // intervals intersect. A meeting ending at 10:00 does not overlap one
  // starting at 10:00.
  bool Overlaps(const MeetingTime& other) const {
    if (day_ != other.day_) return false;
    return !(end_ <= other.begin_ || begin_ >= other.end_);
  }

  // "Mon 09:00-09:50".
  std::string DebugString() const;

  bool operator==(const MeetingTime& other) const {
    return day_ == other.day_ && begin_ == other.begin_ && end_ == other.end_;
  }
  bool operator!=(const MeetingTime& other) const { return !(*this == other); }

 private:
  Weekday day_;
  int begin_;
  int end_;
};

std::ostream& operator<<(std::ostream& out, const MeetingTime& meeting);

}  // namespace course_planner

#endif  // COURSE_PLANNER_CATALOG_MEETING_TIME_H_
