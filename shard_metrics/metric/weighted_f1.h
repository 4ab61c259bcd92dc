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

// F1 score averaged over the classes, weighted by the number of examples of
// each class (also called "support").

#ifndef SHARD_METRICS_METRIC_WEIGHTED_F1_H_
#define SHARD_METRICS_METRIC_WEIGHTED_F1_H_

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "shard_metrics/metric/confusion_matrix.h"
#include "shard_metrics/metric/metric.h"

namespace shard_metrics {
namespace metric {

class WeightedF1Metric final : public Metric {
 public:
  // One-vs-others F1 accumulator of each class, indexed by class label.
  using F1PerClass = std::map<std::string, ClassificationF1Metric>;

  WeightedF1Metric() = default;
  explicit WeightedF1Metric(F1PerClass f1_per_class)
      : f1_per_class_(std::move(f1_per_class)) {}

  // Sum over the classes of the class F1 weighted by the ratio of examples with
  // this class as label. The number of examples is read from any of the classes
  // as all the classes see all the examples. Returns 0 if there are no classes.
  double Value() const override;

  bool MacroAverage() const override { return true; }

  // Union of the classes. The accumulators of the classes present on both
  // sides are merged.
  WeightedF1Metric operator+(const WeightedF1Metric& other) const;

  // Never fails. Exposed for the generic "Merge" functions.
  absl::StatusOr<WeightedF1Metric> Merge(const WeightedF1Metric& other) const {
    return *this + other;
  }

  const F1PerClass& f1_per_class() const { return f1_per_class_; }

  // Zips per-example F1 accumulators of each class into per-example weighted
  // F1 accumulators. The i-th accumulator of each class is expected to be
  // computed on the same example. Fails if the classes don't have the same
  // number of accumulators.
  static absl::StatusOr<std::vector<WeightedF1Metric>> ComputeMany(
      const std::map<std::string, std::vector<ClassificationF1Metric>>&
          f1s_per_class);

 private:
  F1PerClass f1_per_class_;
};

}  // namespace metric
}  // namespace shard_metrics

#endif  // SHARD_METRICS_METRIC_WEIGHTED_F1_H_
