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

// Command-line driver of the schedule planner. It reads a JSON array of
// section records from the registration feed and optional planner parameters
// in text format, then writes the best schedules as JSON and, optionally, one
// iCalendar file per schedule.
//
// Example usage:
// ./schedule_planner --input=sections_202601.json \
//   --params=planner_parameters.textproto --output=schedules.json \
//   --ics_dir=/tmp/calendars --term_start=2026-01-12 --term_end=2026-04-29

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/initialize.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/time/civil_time.h"
#include "absl/time/clock.h"
#include "course_planner/base/file.h"
#include "course_planner/base/logging.h"
#include "course_planner/base/status_macros.h"
#include "course_planner/catalog/section_records.h"
#include "course_planner/export/ical_export.h"
#include "course_planner/scheduling/planner_parameters.pb.h"
#include "course_planner/scheduling/schedule_planner.h"
#include "course_planner/scheduling/schedule_response.pb.h"
#include "google/protobuf/struct.pb.h"

ABSL_FLAG(std::string, input, "",
          "JSON file containing an array of section records.");
ABSL_FLAG(std::string, params, "",
          "Optional file containing a SchedulePlannerParameters in text "
          "format.");
ABSL_FLAG(std::string, output, "",
          "Where to write the schedules as JSON. Printed on stdout if empty.");
ABSL_FLAG(std::string, ics_dir, "",
          "If set, one .ics calendar per schedule is written to this "
          "directory.");
ABSL_FLAG(std::string, term_start, "",
          "First day of classes, YYYY-MM-DD. Derived from the section records "
          "if empty.");
ABSL_FLAG(std::string, term_end, "",
          "Last day of classes, YYYY-MM-DD. Derived from the section records "
          "if empty.");
ABSL_FLAG(std::string, timezone, std::string(course_planner::kDefaultTimezone),
          "Timezone identifier of the calendar events.");

namespace course_planner {
namespace {

// Flag value if set, else the bound derived from the feed.
absl::StatusOr<absl::CivilDay> ResolveTermDay(
    const std::string& flag_value, const std::optional<absl::CivilDay>& derived,
    absl::string_view flag_name) {
  if (!flag_value.empty()) return ParseIsoDate(flag_value);
  if (derived.has_value()) return *derived;
  return absl::InvalidArgumentError(absl::StrCat(
      "Unable to determine the term bounds. Provide --", flag_name, "."));
}

absl::Status WriteCalendars(const ScheduleResponse& response,
                            const google::protobuf::ListValue& records) {
  const std::string directory = absl::GetFlag(FLAGS_ics_dir);
  const SectionMetadataMap metadata = CollectSectionMetadata(records);
  const TermBounds derived = DeriveTermBounds(response, metadata);
  ASSIGN_OR_RETURN(const absl::CivilDay term_start,
                   ResolveTermDay(absl::GetFlag(FLAGS_term_start),
                                  derived.start, "term_start"));
  ASSIGN_OR_RETURN(
      const absl::CivilDay term_end,
      ResolveTermDay(absl::GetFlag(FLAGS_term_end), derived.end, "term_end"));

  const absl::Time now = absl::Now();
  for (const ScheduleOption& option : response.options()) {
    ASSIGN_OR_RETURN(const std::string calendar,
                     BuildCalendar(option, term_start, term_end,
                                   absl::GetFlag(FLAGS_timezone), metadata,
                                   now));
    const std::string path =
        absl::StrCat(directory, "/", CalendarFileName(option.label()));
    RETURN_IF_ERROR(file::SetContents(path, calendar));
    LOG(INFO) << "Wrote " << path;
  }
  return absl::OkStatus();
}

absl::Status Run() {
  if (absl::GetFlag(FLAGS_input).empty()) {
    return absl::InvalidArgumentError("--input is required.");
  }
  SchedulePlannerParameters parameters;
  if (!absl::GetFlag(FLAGS_params).empty()) {
    RETURN_IF_ERROR(file::GetTextProto(absl::GetFlag(FLAGS_params),
                                       &parameters));
  }

  ASSIGN_OR_RETURN(const std::string feed,
                   file::GetContents(absl::GetFlag(FLAGS_input)));
  ASSIGN_OR_RETURN(const google::protobuf::ListValue records,
                   ParseSectionRecordsJson(feed));

  SchedulePlanner planner(parameters);
  ASSIGN_OR_RETURN(const ScheduleResponse response, planner.Solve(records));
  LOG(INFO) << "Found " << response.num_candidates()
            << " conflict-free schedules, kept " << response.options_size();

  ASSIGN_OR_RETURN(const std::string json, ResponseToJson(response));
  if (absl::GetFlag(FLAGS_output).empty()) {
    std::cout << json << std::endl;
  } else {
    RETURN_IF_ERROR(file::SetContents(absl::GetFlag(FLAGS_output), json));
  }

  if (!absl::GetFlag(FLAGS_ics_dir).empty()) {
    RETURN_IF_ERROR(WriteCalendars(response, records));
  }
  return absl::OkStatus();
}

}  // namespace
}  // namespace course_planner

int main(int argc, char** argv) {
  absl::SetProgramUsageMessage(
      "Generates the best conflict-free weekly class schedules from a "
      "registration feed.");
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();
  const absl::Status status = course_planner::Run();
  if (!status.ok()) {
    LOG(ERROR) << status;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
