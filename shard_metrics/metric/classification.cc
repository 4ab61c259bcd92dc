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

#include "shard_metrics/metric/classification.h"

#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "absl/strings/substitute.h"
#include "absl/types/span.h"
#include "shard_metrics/metric/auc.h"
#include "shard_metrics/metric/average.h"
#include "shard_metrics/metric/confusion_matrix.h"
#include "shard_metrics/metric/weighted_f1.h"
#include "shard_metrics/utils/logging.h"
#include "shard_metrics/utils/status_macros.h"

namespace shard_metrics {
namespace metric {

namespace {

constexpr double kDefaultThreshold = 0.5;

}  // namespace

std::string PrecisionMetricName(const absl::string_view class_label) {
  return absl::StrCat("class_", class_label, "_prec");
}

std::string RecallMetricName(const absl::string_view class_label) {
  return absl::StrCat("class_", class_label, "_recall");
}

std::string F1MetricName(const absl::string_view class_label) {
  return absl::StrCat("class_", class_label, "_f1");
}

absl::StatusOr<ClassificationEvaluator> ClassificationEvaluator::Create(
    const proto::ClassificationEvaluationOptions& options) {
  if (options.classes().empty()) {
    return absl::InvalidArgumentError(
        "The evaluation options should contain the list of classes");
  }

  ClassificationEvaluator evaluator;
  evaluator.class_list_.assign(options.classes().begin(),
                               options.classes().end());

  // The reference class is moved to the front of the class list.
  if (options.has_ref_class()) {
    auto it = std::find(evaluator.class_list_.begin(),
                        evaluator.class_list_.end(), options.ref_class());
    if (it == evaluator.class_list_.end()) {
      LOG(WARNING) << "The reference class \"" << options.ref_class()
                   << "\" is not a known class. Using \""
                   << evaluator.class_list_.front() << "\" instead.";
    } else {
      std::rotate(evaluator.class_list_.begin(), it, it + 1);
    }
  }

  for (int class_idx = 0; class_idx < evaluator.class_list_.size();
       class_idx++) {
    const auto& class_label = evaluator.class_list_[class_idx];
    if (!evaluator.class_indices_.emplace(class_label, class_idx).second) {
      return absl::InvalidArgumentError(
          absl::StrCat("The class \"", class_label, "\" is listed twice"));
    }
  }

  const bool binary = evaluator.class_list_.size() == 2;

  if (!(options.threshold() >= 0.0 && options.threshold() <= 1.0)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "The threshold should be in [0, 1]. Got ", options.threshold()));
  }
  if (binary && options.threshold() != kDefaultThreshold) {
    evaluator.threshold_ = options.threshold();
  } else if (!binary && options.threshold() != kDefaultThreshold) {
    LOG(WARNING) << "The threshold only applies to binary classification. "
                    "Ignoring it.";
  }

  if (options.auc_decimal_places() < 0 ||
      options.auc_decimal_places() > AUCMetrics::kMaxDecimalPlaces) {
    return absl::InvalidArgumentError(absl::Substitute(
        "auc_decimal_places should be in [0, $0]. Got $1 instead.",
        AUCMetrics::kMaxDecimalPlaces, options.auc_decimal_places()));
  }
  evaluator.auc_decimal_places_ = options.auc_decimal_places();
  if (options.area_under_curve()) {
    if (binary) {
      evaluator.computes_auc_ = true;
    } else {
      LOG(WARNING) << "The area under the curve is only computed for binary "
                      "classification.";
    }
  }

  LOG(INFO) << "Classification evaluation with classes ["
            << absl::StrJoin(evaluator.class_list_, ", ")
            << "] and reference class \"" << evaluator.ref_class() << "\"";
  return evaluator;
}

absl::StatusOr<std::vector<int>> ClassificationEvaluator::LabelIndices(
    const absl::Span<const std::string> labels) const {
  std::vector<int> indices;
  indices.reserve(labels.size());
  for (const auto& label : labels) {
    const auto it = class_indices_.find(label);
    if (it == class_indices_.end()) {
      LOG_FIRST_N(WARNING, 1) << "One of the labels is not in the class list.";
      return absl::NotFoundError(
          absl::StrCat("Unknown label \"", label, "\". The classes are [",
                       absl::StrJoin(class_list_, ", "), "]"));
    }
    indices.push_back(it->second);
  }
  return indices;
}

absl::StatusOr<std::vector<std::string>> ClassificationEvaluator::PredictLabels(
    const absl::Span<const std::vector<double>> probabilities) const {
  std::vector<std::string> predictions;
  predictions.reserve(probabilities.size());
  for (const auto& example_probabilities : probabilities) {
    if (example_probabilities.size() != class_list_.size()) {
      return absl::InvalidArgumentError(absl::Substitute(
          "Expecting $0 class probabilities per example. Got $1 instead.",
          class_list_.size(), example_probabilities.size()));
    }
    if (threshold_.has_value()) {
      // The reference class is the first class.
      predictions.push_back(example_probabilities.front() > *threshold_
                                ? class_list_[0]
                                : class_list_[1]);
    } else {
      const auto best_class_idx =
          std::max_element(example_probabilities.begin(),
                           example_probabilities.end()) -
          example_probabilities.begin();
      predictions.push_back(class_list_[best_class_idx]);
    }
  }
  return predictions;
}

absl::Status ClassificationEvaluator::RecordConfusionMatrix(
    const absl::Span<const std::string> predictions,
    const absl::Span<const std::string> labels, MetricsReport* report) const {
  RETURN_IF_ERROR(LabelIndices(labels).status());
  RETURN_IF_ERROR(LabelIndices(predictions).status());

  std::map<std::string, std::vector<ClassificationF1Metric>> f1s_per_class;
  for (const auto& class_label : class_list_) {
    ASSIGN_OR_RETURN(auto metrics, ComputePrecisionRecallF1PerExample(
                                       predictions, labels, class_label));
    RETURN_IF_ERROR(report->RecordMany(PrecisionMetricName(class_label),
                                       metrics.precisions));
    RETURN_IF_ERROR(
        report->RecordMany(RecallMetricName(class_label), metrics.recalls));
    RETURN_IF_ERROR(report->RecordMany(F1MetricName(class_label), metrics.f1s));
    f1s_per_class[class_label] = std::move(metrics.f1s);
  }

  ASSIGN_OR_RETURN(const auto weighted_f1s,
                   WeightedF1Metric::ComputeMany(f1s_per_class));
  return report->RecordMany(kWeightedF1MetricName, weighted_f1s);
}

absl::StatusOr<std::vector<std::string>> ClassificationEvaluator::EvaluateStep(
    const Step& step, MetricsReport* report) const {
  if (step.probabilities.size() != step.labels.size()) {
    return absl::InvalidArgumentError(absl::Substitute(
        "The step contains $0 labels and $1 probability rows",
        step.labels.size(), step.probabilities.size()));
  }
  if (!step.losses.empty() && step.losses.size() != step.labels.size()) {
    return absl::InvalidArgumentError(
        absl::Substitute("The step contains $0 labels and $1 losses",
                         step.labels.size(), step.losses.size()));
  }

  ASSIGN_OR_RETURN(auto predictions, PredictLabels(step.probabilities));

  // The metrics of the step are only added to "report" if the whole step is
  // valid.
  MetricsReport step_report;
  if (!step.losses.empty()) {
    RETURN_IF_ERROR(step_report.RecordMany(kLossMetricName,
                                           AverageMetric::Many(step.losses)));
  }

  RETURN_IF_ERROR(
      RecordConfusionMatrix(predictions, step.labels, &step_report));

  if (computes_auc_) {
    std::vector<double> ref_class_probabilities;
    ref_class_probabilities.reserve(step.probabilities.size());
    for (const auto& example_probabilities : step.probabilities) {
      ref_class_probabilities.push_back(example_probabilities.front());
    }
    ASSIGN_OR_RETURN(const auto auc,
                     AUCMetrics::FromRawData(step.labels,
                                             ref_class_probabilities,
                                             ref_class(), auc_decimal_places_));
    RETURN_IF_ERROR(step_report.Record(kAucMetricName, auc));
  }

  RETURN_IF_ERROR(report->MergeFrom(step_report));
  return predictions;
}

}  // namespace metric
}  // namespace shard_metrics
