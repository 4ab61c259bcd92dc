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

#include "shard_metrics/metric/weighted_f1.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/substitute.h"
#include "shard_metrics/utils/logging.h"

namespace shard_metrics {
namespace metric {

double WeightedF1Metric::Value() const {
  if (f1_per_class_.empty()) {
    return 0.0;
  }
  const double total_examples =
      f1_per_class_.begin()->second.counts().Total();
  CHECK_GT(total_examples, 0);

  double weighted_f1 = 0.0;
  for (const auto& class_and_f1 : f1_per_class_) {
    const auto& f1 = class_and_f1.second;
    weighted_f1 +=
        f1.Value() * (f1.counts().ActualPositives() / total_examples);
  }
  return weighted_f1;
}

WeightedF1Metric WeightedF1Metric::operator+(
    const WeightedF1Metric& other) const {
  F1PerClass merged = f1_per_class_;
  for (const auto& class_and_f1 : other.f1_per_class_) {
    auto it = merged.find(class_and_f1.first);
    if (it == merged.end()) {
      merged.emplace(class_and_f1.first, class_and_f1.second);
    } else {
      it->second = it->second + class_and_f1.second;
    }
  }
  return WeightedF1Metric(std::move(merged));
}

absl::StatusOr<std::vector<WeightedF1Metric>> WeightedF1Metric::ComputeMany(
    const std::map<std::string, std::vector<ClassificationF1Metric>>&
        f1s_per_class) {
  if (f1s_per_class.empty()) {
    return std::vector<WeightedF1Metric>();
  }

  const size_t num_examples = f1s_per_class.begin()->second.size();
  for (const auto& class_and_f1s : f1s_per_class) {
    if (class_and_f1s.second.size() != num_examples) {
      return absl::InvalidArgumentError(absl::Substitute(
          "Class \"$0\" has $1 F1 accumulators while class \"$2\" has $3",
          class_and_f1s.first, class_and_f1s.second.size(),
          f1s_per_class.begin()->first, num_examples));
    }
  }

  std::vector<WeightedF1Metric> metrics;
  metrics.reserve(num_examples);
  for (size_t example_idx = 0; example_idx < num_examples; example_idx++) {
    F1PerClass f1_per_class;
    for (const auto& class_and_f1s : f1s_per_class) {
      f1_per_class.emplace(class_and_f1s.first,
                           class_and_f1s.second[example_idx]);
    }
    metrics.emplace_back(std::move(f1_per_class));
  }
  return metrics;
}

}  // namespace metric
}  // namespace shard_metrics
