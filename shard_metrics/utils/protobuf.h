/*
 * Copyright 2021 Google LLC.
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Utilities for the manipulation of Protobufs.

#ifndef SHARD_METRICS_UTILS_PROTOBUF_H_
#define SHARD_METRICS_UTILS_PROTOBUF_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"
#include "google/protobuf/text_format.h"

namespace shard_metrics {
namespace utils {

// Deserializes a proto from its text representation.
template <typename T>
absl::StatusOr<T> ParseTextProto(absl::string_view raw) {
  T message;
  if (!google::protobuf::TextFormat::ParseFromString(std::string(raw),
                                                     &message)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Cannot parse protobuf ", T::descriptor()->full_name(), " from text"));
  }
  return message;
}

// Deserializes a proto from its binary representation.
template <typename T>
absl::StatusOr<T> ParseBinaryProto(absl::string_view raw) {
  T message;
  if (!message.ParseFromString(std::string(raw))) {
    return absl::InvalidArgumentError(
        absl::StrCat("Cannot parse protobuf ", T::descriptor()->full_name(),
                     " from binary text"));
  }
  return message;
}

// Serializes a proto in the text format accepted by "ParseTextProto".
absl::StatusOr<std::string> SerializeTextProto(
    const google::protobuf::Message& message);

}  // namespace utils
}  // namespace shard_metrics

#endif  // SHARD_METRICS_UTILS_PROTOBUF_H_
