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

#ifndef COURSE_PLANNER_BASE_FILE_H_
#define COURSE_PLANNER_BASE_FILE_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"
#include "course_planner/base/status_macros.h"

// Whole-file helpers used by the command-line tools. The planning library
// itself performs no I/O.
namespace file {

// ---- Content API ----

absl::StatusOr<std::string> GetContents(absl::string_view path);

absl::Status GetContents(absl::string_view file_name, std::string* output);

absl::Status SetContents(absl::string_view file_name,
                         absl::string_view contents);

// ---- Protobuf API ----

// Reads a text-format proto. Parse errors are reported in the status message
// with their line and column.
absl::Status GetTextProto(absl::string_view file_name,
                          google::protobuf::Message* proto);

template <typename T>
absl::StatusOr<T> GetTextProto(absl::string_view file_name) {
  T proto;
  RETURN_IF_ERROR(GetTextProto(file_name, &proto));
  return proto;
}

}  // namespace file

#endif  // COURSE_PLANNER_BASE_FILE_H_
