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

#ifndef SHARD_METRICS_METRIC_AVERAGE_H_
#define SHARD_METRICS_METRIC_AVERAGE_H_

#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "shard_metrics/metric/metric.h"
#include "shard_metrics/utils/logging.h"

namespace shard_metrics {
namespace metric {

// Mean of a set of values e.g. the loss of the examples.
class AverageMetric final : public Metric {
 public:
  AverageMetric() = default;
  AverageMetric(const double sum, const double count)
      : sum_(sum), count_(count) {
    CHECK_GE(count_, 0);
  }

  // One accumulator per value.
  static std::vector<AverageMetric> Many(absl::Span<const double> values) {
    std::vector<AverageMetric> metrics;
    metrics.reserve(values.size());
    for (const double value : values) {
      metrics.emplace_back(value, 1);
    }
    return metrics;
  }

  // Returns 0 if there are no values.
  double Value() const override {
    if (count_ == 0) {
      return 0.0;
    }
    return sum_ / count_;
  }

  bool MacroAverage() const override { return false; }

  AverageMetric operator+(const AverageMetric& other) const {
    return AverageMetric(sum_ + other.sum_, count_ + other.count_);
  }

  absl::StatusOr<AverageMetric> Merge(const AverageMetric& other) const {
    return *this + other;
  }

  double sum() const { return sum_; }
  double count() const { return count_; }

 private:
  double sum_ = 0;
  double count_ = 0;
};

}  // namespace metric
}  // namespace shard_metrics

#endif  // SHARD_METRICS_METRIC_AVERAGE_H_
