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

// Normalization of raw section records from a registration-system feed into
// the typed Course/Section entities of a CourseCatalog.
//
// A raw record is an arbitrary JSON object (google.protobuf.Struct) using the
// field names of the Banner feed:
//
//   {
//     "subject": "CSCI",
//     "subjectCourse": "CSCI1200",
//     "courseTitle": "Data Structures",
//     "creditHours": 4,
//     "seatsAvailable": 12,
//     "courseReferenceNumber": "40321",
//     "meetingsFaculty": [
//       {"meetingTime": {"beginTime": "1000", "endTime": "1150",
//                        "monday": true, "thursday": true,
//                        "creditHourSession": 4}}
//     ]
//   }
//
// Normalization never fails: malformed meeting blocks are skipped, and
// records without any valid meeting are dropped. Skips are logged with
// VLOG(1).

#ifndef COURSE_PLANNER_CATALOG_CATALOG_NORMALIZER_H_
#define COURSE_PLANNER_CATALOG_CATALOG_NORMALIZER_H_

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/statusor.h"
#include "course_planner/catalog/course_catalog.h"
#include "course_planner/catalog/meeting_time.h"
#include "google/protobuf/struct.pb.h"

namespace course_planner {

// Which records are admitted into the catalog.
struct CatalogFilter {
  // Records with fewer available seats are excluded.
  int min_seats_available = 1;
  // When non-empty, only these subjects are admitted.
  absl::flat_hash_set<std::string> include_subjects;
  // Subjects never admitted. Checked after include_subjects.
  absl::flat_hash_set<std::string> exclude_subjects;
};

struct NormalizationStats {
  int64_t records_seen = 0;
  // Excluded by the seat or subject filters.
  int64_t records_filtered = 0;
  // Not an object, or without a course code.
  int64_t records_malformed = 0;
  int64_t sections_added = 0;
  // Records without any valid meeting time.
  int64_t sections_dropped = 0;
  int64_t meeting_blocks_skipped = 0;

  std::string DebugString() const;
};

// Returns the record's "creditHours" when it is a non-zero number (or numeric
// string), else the sum of the "creditHourSession" of its meeting blocks.
// Missing or non-numeric values count as 0.
double ComputeSectionCredits(const google::protobuf::Struct& record);

// Parses one "meetingTime" block into one MeetingTime per day flag set in the
// block. Returns an error if the begin or end time is missing or malformed, or
// if the block does not have a positive duration.
absl::StatusOr<std::vector<MeetingTime>> ParseMeetingBlock(
    const google::protobuf::Struct& meeting_time);

// Collects the meeting times of all the valid blocks of a record. If not null,
// `num_skipped_blocks` is incremented for every block that was skipped.
std::vector<MeetingTime> ExtractMeetingTimes(
    const google::protobuf::Struct& record, int64_t* num_skipped_blocks);

class CatalogNormalizer {
 public:
  explicit CatalogNormalizer(CatalogFilter filter)
      : filter_(std::move(filter)) {}

  // Adds the record to `catalog` as a section of its course, creating the
  // course on first encounter.
  void AddRecord(const google::protobuf::Struct& record,
                 CourseCatalog* catalog);

  // Same as AddRecord() for each element of the list. Elements that are not
  // objects are counted as malformed.
  void AddRecords(const google::protobuf::ListValue& records,
                  CourseCatalog* catalog);

  const NormalizationStats& stats() const { return stats_; }

 private:
  bool IsAdmitted(const google::protobuf::Struct& record) const;

  const CatalogFilter filter_;
  NormalizationStats stats_;
};

}  // namespace course_planner

#endif  // COURSE_PLANNER_CATALOG_CATALOG_NORMALIZER_H_
