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

// Conversion of the metric accumulators to and from protos, for example to
// send the report of a worker to the manager.
//
// The "FromProto" methods check the invariants of the accumulators and return
// an InvalidArgument error if the proto is not consistent.

#ifndef SHARD_METRICS_METRIC_SERIALIZATION_H_
#define SHARD_METRICS_METRIC_SERIALIZATION_H_

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "shard_metrics/metric/auc.h"
#include "shard_metrics/metric/average.h"
#include "shard_metrics/metric/confusion_matrix.h"
#include "shard_metrics/metric/metric.pb.h"
#include "shard_metrics/metric/report.h"
#include "shard_metrics/metric/weighted_f1.h"

namespace shard_metrics {
namespace metric {

proto::ConfusionMatrix ConfusionCountsToProto(const ConfusionCounts& counts);
absl::StatusOr<ConfusionCounts> ConfusionCountsFromProto(
    const proto::ConfusionMatrix& src);

proto::WeightedF1 WeightedF1ToProto(const WeightedF1Metric& metric);
absl::StatusOr<WeightedF1Metric> WeightedF1FromProto(
    const proto::WeightedF1& src);

proto::AucCurve AucToProto(const AUCMetrics& metric);
absl::StatusOr<AUCMetrics> AucFromProto(const proto::AucCurve& src);

proto::Average AverageToProto(const AverageMetric& metric);
absl::StatusOr<AverageMetric> AverageFromProto(const proto::Average& src);

proto::NamedMetric MetricToProto(absl::string_view name,
                                 const MetricValue& metric);
absl::StatusOr<MetricValue> MetricFromProto(const proto::NamedMetric& src);

proto::MetricsReport ReportToProto(const MetricsReport& report);

// Metrics with the same name are merged.
absl::StatusOr<MetricsReport> ReportFromProto(const proto::MetricsReport& src);

}  // namespace metric
}  // namespace shard_metrics

#endif  // SHARD_METRICS_METRIC_SERIALIZATION_H_
