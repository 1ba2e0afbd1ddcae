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

#include "course_planner/catalog/section_records.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/struct.pb.h"
#include "google/protobuf/util/json_util.h"

namespace course_planner {

absl::StatusOr<google::protobuf::ListValue> ParseSectionRecordsJson(
    absl::string_view json) {
  google::protobuf::ListValue records;
  const auto status =
      google::protobuf::util::JsonStringToMessage(std::string(json), &records);
  if (!status.ok()) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Section feed is not a JSON array of records: ", status.ToString()));
  }
  return records;
}

const google::protobuf::Value* FindField(const google::protobuf::Struct& record,
                                         absl::string_view name) {
  const auto it = record.fields().find(std::string(name));
  return it == record.fields().end() ? nullptr : &it->second;
}

const google::protobuf::Struct* FindStructField(
    const google::protobuf::Struct& record, absl::string_view name) {
  const google::protobuf::Value* const value = FindField(record, name);
  if (value == nullptr ||
      value->kind_case() != google::protobuf::Value::kStructValue) {
    return nullptr;
  }
  return &value->struct_value();
}

const google::protobuf::ListValue* FindListField(
    const google::protobuf::Struct& record, absl::string_view name) {
  const google::protobuf::Value* const value = FindField(record, name);
  if (value == nullptr ||
      value->kind_case() != google::protobuf::Value::kListValue) {
    return nullptr;
  }
  return &value->list_value();
}

std::optional<double> ValueAsNumber(const google::protobuf::Value& value) {
  double number = 0.0;
  switch (value.kind_case()) {
    case google::protobuf::Value::kNumberValue:
      number = value.number_value();
      break;
    case google::protobuf::Value::kStringValue:
      if (!absl::SimpleAtod(absl::StripAsciiWhitespace(value.string_value()),
                            &number)) {
        return std::nullopt;
      }
      break;
    default:
      return std::nullopt;
  }
  if (!std::isfinite(number)) return std::nullopt;
  return number;
}

std::string ValueAsString(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kStringValue:
      return value.string_value();
    case google::protobuf::Value::kNumberValue: {
      const double number = value.number_value();
      if (std::isfinite(number) && std::trunc(number) == number &&
          std::abs(number) <
              static_cast<double>(std::numeric_limits<int64_t>::max())) {
        return absl::StrCat(static_cast<int64_t>(number));
      }
      return absl::StrCat(number);
    }
    case google::protobuf::Value::kBoolValue:
      return value.bool_value() ? "true" : "false";
    default:
      return "";
  }
}

bool ValueIsTruthy(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kBoolValue:
      return value.bool_value();
    case google::protobuf::Value::kNumberValue:
      return value.number_value() != 0.0;
    case google::protobuf::Value::kStringValue:
      return !value.string_value().empty();
    case google::protobuf::Value::kStructValue:
      return value.struct_value().fields_size() > 0;
    case google::protobuf::Value::kListValue:
      return value.list_value().values_size() > 0;
    default:
      return false;
  }
}

std::optional<double> FieldAsNumber(const google::protobuf::Struct& record,
                                    absl::string_view name) {
  const google::protobuf::Value* const value = FindField(record, name);
  if (value == nullptr) return std::nullopt;
  return ValueAsNumber(*value);
}

std::string FieldAsString(const google::protobuf::Struct& record,
                          absl::string_view name) {
  const google::protobuf::Value* const value = FindField(record, name);
  if (value == nullptr) return "";
  return ValueAsString(*value);
}

}  // namespace course_planner
