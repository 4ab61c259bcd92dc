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

#include "shard_metrics/metric/report.h"

#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/strings/substitute.h"
#include "absl/types/optional.h"
#include "absl/types/span.h"
#include "absl/types/variant.h"
#include "shard_metrics/utils/status_macros.h"

namespace shard_metrics {
namespace metric {

absl::string_view MetricTypeName(const MetricValue& value) {
  return absl::visit(
      [](const auto& metric) -> absl::string_view {
        using T = std::decay_t<decltype(metric)>;
        if constexpr (std::is_same<T, WeightedF1Metric>::value) {
          return "weighted_f1";
        } else if constexpr (std::is_same<T, AUCMetrics>::value) {
          return "auc";
        } else if constexpr (std::is_same<T, AverageMetric>::value) {
          return "average";
        } else {
          return ConfusionMatrixViewName(T::kViewType);
        }
      },
      value);
}

const Metric& AsMetric(const MetricValue& value) {
  return absl::visit([](const auto& metric) -> const Metric& { return metric; },
                     value);
}

absl::StatusOr<double> ComputeMetricValue(const MetricValue& value) {
  if (absl::holds_alternative<AUCMetrics>(value)) {
    return absl::get<AUCMetrics>(value).ComputeAuc();
  }
  return AsMetric(value).Value();
}

absl::StatusOr<MetricValue> MergeMetricValues(const MetricValue& a,
                                              const MetricValue& b) {
  if (a.index() != b.index()) {
    return absl::InvalidArgumentError(
        absl::Substitute("Cannot merge a \"$0\" metric with a \"$1\" metric",
                         MetricTypeName(a), MetricTypeName(b)));
  }
  return absl::visit(
      [&b](const auto& typed_a) -> absl::StatusOr<MetricValue> {
        using T = std::decay_t<decltype(typed_a)>;
        ASSIGN_OR_RETURN(auto merged, typed_a.Merge(absl::get<T>(b)));
        return MetricValue(std::move(merged));
      },
      a);
}

absl::Status MetricsReport::Record(const absl::string_view name,
                                   const MetricValue& metric) {
  auto it = metrics_.find(name);
  if (it == metrics_.end()) {
    metrics_.emplace(std::string(name), metric);
    return absl::OkStatus();
  }
  auto merged = MergeMetricValues(it->second, metric);
  if (!merged.ok()) {
    return absl::Status(merged.status().code(),
                        absl::StrCat("Cannot record metric \"", name,
                                     "\": ", merged.status().message()));
  }
  it->second = std::move(merged).value();
  return absl::OkStatus();
}

absl::Status MetricsReport::MergeFrom(const MetricsReport& other) {
  // All the merges are computed before the report is modified.
  std::vector<std::pair<const std::string*, MetricValue>> merged_metrics;
  merged_metrics.reserve(other.metrics_.size());
  for (const auto& name_and_metric : other.metrics_) {
    const auto it = metrics_.find(name_and_metric.first);
    if (it == metrics_.end()) {
      merged_metrics.emplace_back(&name_and_metric.first,
                                  name_and_metric.second);
      continue;
    }
    auto merged = MergeMetricValues(it->second, name_and_metric.second);
    if (!merged.ok()) {
      return absl::Status(
          merged.status().code(),
          absl::StrCat("Cannot merge metric \"", name_and_metric.first,
                       "\": ", merged.status().message()));
    }
    merged_metrics.emplace_back(&name_and_metric.first,
                                std::move(merged).value());
  }
  for (auto& name_and_metric : merged_metrics) {
    metrics_.insert_or_assign(*name_and_metric.first,
                              std::move(name_and_metric.second));
  }
  return absl::OkStatus();
}

const MetricValue* MetricsReport::Find(const absl::string_view name) const {
  const auto it = metrics_.find(name);
  if (it == metrics_.end()) {
    return nullptr;
  }
  return &it->second;
}

absl::StatusOr<double> MetricsReport::Value(
    const absl::string_view name) const {
  const auto* metric = Find(name);
  if (metric == nullptr) {
    return absl::NotFoundError(absl::StrCat("No metric called \"", name, "\""));
  }
  return ComputeMetricValue(*metric);
}

absl::StatusOr<bool> MetricsReport::MacroAverage(
    const absl::string_view name) const {
  const auto* metric = Find(name);
  if (metric == nullptr) {
    return absl::NotFoundError(absl::StrCat("No metric called \"", name, "\""));
  }
  return AsMetric(*metric).MacroAverage();
}

std::vector<std::string> MetricsReport::Names() const {
  std::vector<std::string> names;
  names.reserve(metrics_.size());
  for (const auto& name_and_metric : metrics_) {
    names.push_back(name_and_metric.first);
  }
  return names;
}

absl::StatusOr<std::map<std::string, double>> AggregateShardReports(
    const absl::Span<const MetricsReport> shards) {
  // Merging all the shards also checks that the types are consistent.
  MetricsReport merged;
  for (const auto& shard : shards) {
    RETURN_IF_ERROR(merged.MergeFrom(shard));
  }

  std::map<std::string, double> values;
  for (const auto& name_and_metric : merged.metrics()) {
    const auto& name = name_and_metric.first;
    if (!AsMetric(name_and_metric.second).MacroAverage()) {
      ASSIGN_OR_RETURN(values[name],
                       ComputeMetricValue(name_and_metric.second));
      continue;
    }

    double sum_values = 0;
    int num_shards = 0;
    for (const auto& shard : shards) {
      const auto* shard_metric = shard.Find(name);
      if (shard_metric == nullptr) {
        continue;
      }
      ASSIGN_OR_RETURN(const double shard_value,
                       ComputeMetricValue(*shard_metric));
      sum_values += shard_value;
      num_shards++;
    }
    values[name] = sum_values / num_shards;
  }
  return values;
}

}  // namespace metric
}  // namespace shard_metrics
