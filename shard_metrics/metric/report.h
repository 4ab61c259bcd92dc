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

// Named collection of metric accumulators.
//
// A report is filled by one caller (e.g. one worker) by recording the metric
// accumulators computed on each batch. Reports of different shards are then
// merged, or aggregated with "AggregateShardReports".
//
// Usage example:
//   MetricsReport report;
//   for (const auto& batch : batches) {
//     ASSIGN_OR_RETURN(const auto metrics,
//                      ComputePrecisionRecallF1PerExample(
//                          batch.predictions, batch.labels, "yes"));
//     RETURN_IF_ERROR(report.RecordMany("precision", metrics.precisions));
//   }
//   ASSIGN_OR_RETURN(const double precision, report.Value("precision"));

#ifndef SHARD_METRICS_METRIC_REPORT_H_
#define SHARD_METRICS_METRIC_REPORT_H_

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "absl/types/variant.h"
#include "shard_metrics/metric/auc.h"
#include "shard_metrics/metric/average.h"
#include "shard_metrics/metric/confusion_matrix.h"
#include "shard_metrics/metric/metric.h"
#include "shard_metrics/metric/weighted_f1.h"
#include "shard_metrics/utils/status_macros.h"

namespace shard_metrics {
namespace metric {

// Any of the metric accumulators.
using MetricValue =
    absl::variant<PrecisionMetric, RecallMetric, ClassificationF1Metric,
                  WeightedF1Metric, AUCMetrics, AverageMetric>;

// Name of the type of accumulator e.g. "precision".
absl::string_view MetricTypeName(const MetricValue& value);

// The accumulator as a "Metric".
const Metric& AsMetric(const MetricValue& value);

// Value of an accumulator. Unlike "Metric::Value", returns an error instead of
// crashing when the value is not defined.
absl::StatusOr<double> ComputeMetricValue(const MetricValue& value);

// Merges two accumulators. Fails if the accumulators are of different types,
// or if the accumulators themselves cannot be merged.
absl::StatusOr<MetricValue> MergeMetricValues(const MetricValue& a,
                                              const MetricValue& b);

class MetricsReport {
 public:
  using MetricMap = std::map<std::string, MetricValue, std::less<>>;

  // Merges "metric" into the accumulator called "name". Fails if an
  // accumulator with a different type is already recorded under "name".
  absl::Status Record(absl::string_view name, const MetricValue& metric);

  // Merges all the "metrics" into the accumulator called "name". Does nothing
  // if "metrics" is empty.
  template <typename T>
  absl::Status RecordMany(absl::string_view name,
                          const std::vector<T>& metrics) {
    for (const auto& metric : metrics) {
      RETURN_IF_ERROR(Record(name, metric));
    }
    return absl::OkStatus();
  }

  // Merges all the accumulators of "other". On failure, the report is left
  // unchanged.
  absl::Status MergeFrom(const MetricsReport& other);

  // Accumulator called "name", or nullptr if there are none.
  const MetricValue* Find(absl::string_view name) const;

  // Value of the accumulator called "name". Fails with NotFound if there are
  // no such accumulator.
  absl::StatusOr<double> Value(absl::string_view name) const;

  // Whether the accumulator called "name" is macro-averaged over shards.
  absl::StatusOr<bool> MacroAverage(absl::string_view name) const;

  // Names of the accumulators, sorted.
  std::vector<std::string> Names() const;

  const MetricMap& metrics() const { return metrics_; }

  bool empty() const { return metrics_.empty(); }

 private:
  MetricMap metrics_;
};

// Computes the final value of each metric over a set of shard reports.
// Macro-averaged metrics are the unweighted mean of the value of the shards
// containing the metric. Other metrics are merged over the shards, and the
// value is computed on the merged accumulator. Fails if the shards contain
// accumulators of different types under the same name.
absl::StatusOr<std::map<std::string, double>> AggregateShardReports(
    absl::Span<const MetricsReport> shards);

}  // namespace metric
}  // namespace shard_metrics

#endif  // SHARD_METRICS_METRIC_REPORT_H_
