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

#include "shard_metrics/metric/serialization.h"

#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/strings/substitute.h"
#include "absl/types/variant.h"
#include "shard_metrics/utils/status_macros.h"

namespace shard_metrics {
namespace metric {

proto::ConfusionMatrix ConfusionCountsToProto(const ConfusionCounts& counts) {
  proto::ConfusionMatrix dst;
  dst.set_true_positives(counts.true_positives);
  dst.set_true_negatives(counts.true_negatives);
  dst.set_false_positives(counts.false_positives);
  dst.set_false_negatives(counts.false_negatives);
  return dst;
}

absl::StatusOr<ConfusionCounts> ConfusionCountsFromProto(
    const proto::ConfusionMatrix& src) {
  // Note: Also rejects NaNs.
  if (!(src.true_positives() >= 0 && src.true_negatives() >= 0 &&
        src.false_positives() >= 0 && src.false_negatives() >= 0)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Negative confusion matrix cell: ", src.DebugString()));
  }
  return ConfusionCounts{src.true_positives(), src.true_negatives(),
                         src.false_positives(), src.false_negatives()};
}

proto::WeightedF1 WeightedF1ToProto(const WeightedF1Metric& metric) {
  proto::WeightedF1 dst;
  for (const auto& class_and_f1 : metric.f1_per_class()) {
    (*dst.mutable_f1_per_class())[class_and_f1.first] =
        ConfusionCountsToProto(class_and_f1.second.counts());
  }
  return dst;
}

absl::StatusOr<WeightedF1Metric> WeightedF1FromProto(
    const proto::WeightedF1& src) {
  WeightedF1Metric::F1PerClass f1_per_class;
  for (const auto& class_and_f1 : src.f1_per_class()) {
    ASSIGN_OR_RETURN(const auto counts,
                     ConfusionCountsFromProto(class_and_f1.second));
    f1_per_class.emplace(class_and_f1.first, ClassificationF1Metric(counts));
  }

  // The value is weighted by the number of examples of the first class.
  for (const auto& class_and_f1 : f1_per_class) {
    if (!(class_and_f1.second.counts().Total() > 0)) {
      return absl::InvalidArgumentError(
          absl::StrCat("The weighted F1 of class \"", class_and_f1.first,
                       "\" has no examples"));
    }
  }
  return WeightedF1Metric(std::move(f1_per_class));
}

proto::AucCurve AucToProto(const AUCMetrics& metric) {
  proto::AucCurve dst;
  dst.set_class_label(metric.class_label());
  dst.mutable_thresholds()->Reserve(metric.thresholds().size());
  for (const double threshold : metric.thresholds()) {
    dst.add_thresholds(threshold);
  }
  for (const auto& bucket : metric.buckets()) {
    dst.add_false_positives(bucket.false_positives);
    dst.add_true_positives(bucket.true_positives);
  }
  dst.set_positive_count(metric.positive_count());
  dst.set_negative_count(metric.negative_count());
  return dst;
}

absl::StatusOr<AUCMetrics> AucFromProto(const proto::AucCurve& src) {
  if (src.false_positives_size() != src.thresholds_size() ||
      src.true_positives_size() != src.thresholds_size()) {
    return absl::InvalidArgumentError(absl::Substitute(
        "Inconsistent AUC curve: $0 thresholds, $1 false positive counts and "
        "$2 true positive counts",
        src.thresholds_size(), src.false_positives_size(),
        src.true_positives_size()));
  }
  std::vector<double> thresholds(src.thresholds().begin(),
                                 src.thresholds().end());
  std::vector<RocBucket> buckets;
  buckets.reserve(src.thresholds_size());
  for (int threshold_idx = 0; threshold_idx < src.thresholds_size();
       threshold_idx++) {
    buckets.push_back({src.false_positives(threshold_idx),
                       src.true_positives(threshold_idx)});
  }
  return AUCMetrics::Create(src.class_label(), std::move(thresholds),
                            std::move(buckets), src.positive_count(),
                            src.negative_count());
}

proto::Average AverageToProto(const AverageMetric& metric) {
  proto::Average dst;
  dst.set_sum(metric.sum());
  dst.set_count(metric.count());
  return dst;
}

absl::StatusOr<AverageMetric> AverageFromProto(const proto::Average& src) {
  if (!(src.count() >= 0)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Negative number of values: ", src.count()));
  }
  return AverageMetric(src.sum(), src.count());
}

proto::NamedMetric MetricToProto(const absl::string_view name,
                                 const MetricValue& metric) {
  proto::NamedMetric dst;
  dst.set_name(std::string(name));
  absl::visit(
      [&dst](const auto& typed_metric) {
        using T = std::decay_t<decltype(typed_metric)>;
        if constexpr (std::is_same<T, PrecisionMetric>::value) {
          *dst.mutable_precision() =
              ConfusionCountsToProto(typed_metric.counts());
        } else if constexpr (std::is_same<T, RecallMetric>::value) {
          *dst.mutable_recall() = ConfusionCountsToProto(typed_metric.counts());
        } else if constexpr (std::is_same<T, ClassificationF1Metric>::value) {
          *dst.mutable_f1() = ConfusionCountsToProto(typed_metric.counts());
        } else if constexpr (std::is_same<T, WeightedF1Metric>::value) {
          *dst.mutable_weighted_f1() = WeightedF1ToProto(typed_metric);
        } else if constexpr (std::is_same<T, AUCMetrics>::value) {
          *dst.mutable_auc() = AucToProto(typed_metric);
        } else {
          static_assert(std::is_same<T, AverageMetric>::value,
                        "Non supported metric");
          *dst.mutable_average() = AverageToProto(typed_metric);
        }
      },
      metric);
  return dst;
}

absl::StatusOr<MetricValue> MetricFromProto(const proto::NamedMetric& src) {
  switch (src.type_case()) {
    case proto::NamedMetric::kPrecision: {
      ASSIGN_OR_RETURN(const auto counts,
                       ConfusionCountsFromProto(src.precision()));
      return MetricValue(PrecisionMetric(counts));
    }
    case proto::NamedMetric::kRecall: {
      ASSIGN_OR_RETURN(const auto counts,
                       ConfusionCountsFromProto(src.recall()));
      return MetricValue(RecallMetric(counts));
    }
    case proto::NamedMetric::kF1: {
      ASSIGN_OR_RETURN(const auto counts, ConfusionCountsFromProto(src.f1()));
      return MetricValue(ClassificationF1Metric(counts));
    }
    case proto::NamedMetric::kWeightedF1: {
      ASSIGN_OR_RETURN(auto metric, WeightedF1FromProto(src.weighted_f1()));
      return MetricValue(std::move(metric));
    }
    case proto::NamedMetric::kAuc: {
      ASSIGN_OR_RETURN(auto metric, AucFromProto(src.auc()));
      return MetricValue(std::move(metric));
    }
    case proto::NamedMetric::kAverage: {
      ASSIGN_OR_RETURN(auto metric, AverageFromProto(src.average()));
      return MetricValue(std::move(metric));
    }
    case proto::NamedMetric::TYPE_NOT_SET:
      break;
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Metric \"", src.name(), "\" has no value"));
}

proto::MetricsReport ReportToProto(const MetricsReport& report) {
  proto::MetricsReport dst;
  for (const auto& name_and_metric : report.metrics()) {
    *dst.add_metrics() =
        MetricToProto(name_and_metric.first, name_and_metric.second);
  }
  return dst;
}

absl::StatusOr<MetricsReport> ReportFromProto(const proto::MetricsReport& src) {
  MetricsReport report;
  for (const auto& named_metric : src.metrics()) {
    if (named_metric.name().empty()) {
      return absl::InvalidArgumentError("Metric without a name");
    }
    ASSIGN_OR_RETURN(const auto metric, MetricFromProto(named_metric));
    RETURN_IF_ERROR(report.Record(named_metric.name(), metric));
  }
  return report;
}

}  // namespace metric
}  // namespace shard_metrics
