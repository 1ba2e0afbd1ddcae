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

#include "course_planner/base/file.h"

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "course_planner/base/logging.h"
#include "course_planner/base/status_builder.h"
#include "google/protobuf/io/tokenizer.h"
#include "google/protobuf/message.h"
#include "google/protobuf/text_format.h"

namespace file {
namespace {

struct FileCloser {
  void operator()(FILE* f) const {
    if (f != nullptr) fclose(f);
  }
};
using ScopedFile = std::unique_ptr<FILE, FileCloser>;

ScopedFile OpenFile(absl::string_view file_name, const char* mode) {
  const std::string null_terminated_name(file_name);
  return ScopedFile(fopen(null_terminated_name.c_str(), mode));
}

// Collects text-format parse errors so they can be reported in a status.
class CollectingErrorCollector : public google::protobuf::io::ErrorCollector {
 public:
  ~CollectingErrorCollector() override = default;
  void AddError(int line, int column, const std::string& message) override {
    errors_.push_back(absl::StrCat(line + 1, ":", column + 1, ": ", message));
  }
  const std::vector<std::string>& errors() const { return errors_; }

 private:
  std::vector<std::string> errors_;
};

}  // namespace

absl::StatusOr<std::string> GetContents(absl::string_view path) {
  std::string contents;
  absl::Status status = GetContents(path, &contents);
  if (!status.ok()) {
    return status;
  }
  return contents;
}

absl::Status GetContents(absl::string_view file_name, std::string* output) {
  ScopedFile f = OpenFile(file_name, "rb");
  if (f == nullptr) {
    return course_planner::NotFoundErrorBuilder()
           << "Could not open '" << file_name << "'.";
  }
  output->clear();
  char buffer[4096];
  size_t read = 0;
  while ((read = fread(buffer, 1, sizeof(buffer), f.get())) > 0) {
    output->append(buffer, read);
  }
  if (ferror(f.get())) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not read from '", file_name, "'."));
  }
  return absl::OkStatus();
}

absl::Status SetContents(absl::string_view file_name,
                         absl::string_view contents) {
  ScopedFile f = OpenFile(file_name, "wb");
  if (f == nullptr) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not open '", file_name, "' for writing."));
  }
  if (fwrite(contents.data(), 1, contents.size(), f.get()) !=
      contents.size()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not write to '", file_name, "'."));
  }
  if (fclose(f.release()) != 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not close '", file_name, "'."));
  }
  return absl::OkStatus();
}

absl::Status GetTextProto(absl::string_view file_name,
                          google::protobuf::Message* proto) {
  std::string str;
  RETURN_IF_ERROR(GetContents(file_name, &str))
      << "while reading " << proto->GetTypeName();
  CollectingErrorCollector error_collector;
  google::protobuf::TextFormat::Parser parser;
  parser.RecordErrorsTo(&error_collector);
  if (!parser.ParseFromString(str, proto)) {
    VLOG(1) << "Could not parse '" << file_name << "'";
    return absl::InvalidArgumentError(
        absl::StrCat("Could not parse ", proto->GetTypeName(), " from '",
                     file_name, "': ",
                     absl::StrJoin(error_collector.errors(), "; ")));
  }
  return absl::OkStatus();
}

}  // namespace file
