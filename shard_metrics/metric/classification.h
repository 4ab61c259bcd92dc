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

// Evaluation of a classifier, one step (e.g. one batch) at a time.
//
// For each step, the evaluator turns the predicted class probabilities into
// predicted classes, and records in a "MetricsReport":
//   - "class_<c>_prec", "class_<c>_recall", "class_<c>_f1": The one-vs-others
//     precision, recall and F1 of each class "c".
//   - "weighted_f1": The F1 averaged over the classes.
//   - "auc": The ROC AUC of the reference class (binary classification only,
//     if enabled).
//   - "loss": The mean of the per-example losses (if provided).
//
// Usage example:
//   ASSIGN_OR_RETURN(const auto evaluator,
//                    ClassificationEvaluator::Create(options));
//   MetricsReport report;
//   for (const auto& step : steps) {
//     ASSIGN_OR_RETURN(const auto predictions,
//                      evaluator.EvaluateStep(step, &report));
//   }
//   ASSIGN_OR_RETURN(const double weighted_f1, report.Value("weighted_f1"));

#ifndef SHARD_METRICS_METRIC_CLASSIFICATION_H_
#define SHARD_METRICS_METRIC_CLASSIFICATION_H_

#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "absl/types/span.h"
#include "shard_metrics/metric/metric.pb.h"
#include "shard_metrics/metric/report.h"

namespace shard_metrics {
namespace metric {

constexpr char kWeightedF1MetricName[] = "weighted_f1";
constexpr char kAucMetricName[] = "auc";
constexpr char kLossMetricName[] = "loss";

// Names of the per-class metrics.
std::string PrecisionMetricName(absl::string_view class_label);
std::string RecallMetricName(absl::string_view class_label);
std::string F1MetricName(absl::string_view class_label);

class ClassificationEvaluator {
 public:
  // Predictions and ground truth of an evaluation step.
  struct Step {
    // True label of each example.
    std::vector<std::string> labels;
    // "probabilities[i][j]" is the predicted probability of the class
    // "class_list()[j]" for the i-th example.
    std::vector<std::vector<double>> probabilities;
    // Loss of each example. Can be empty.
    std::vector<double> losses;
  };

  // Fails if the options are not valid e.g. no classes are provided.
  static absl::StatusOr<ClassificationEvaluator> Create(
      const proto::ClassificationEvaluationOptions& options);

  // The classes. The reference class is the first class.
  const std::vector<std::string>& class_list() const { return class_list_; }

  const std::string& ref_class() const { return class_list_.front(); }

  // Decision threshold on the probability of the reference class. Only set for
  // binary classification with a threshold different from 0.5. Otherwise, the
  // most likely class is predicted.
  const absl::optional<double>& threshold() const { return threshold_; }

  bool computes_auc() const { return computes_auc_; }

  // Index of each label in "class_list()". Fails with NotFound if a label is
  // not a known class.
  absl::StatusOr<std::vector<int>> LabelIndices(
      absl::Span<const std::string> labels) const;

  // Predicted class of each example.
  absl::StatusOr<std::vector<std::string>> PredictLabels(
      absl::Span<const std::vector<double>> probabilities) const;

  // Records the per-class precision, recall and F1, and the weighted F1 of
  // each example.
  absl::Status RecordConfusionMatrix(absl::Span<const std::string> predictions,
                                     absl::Span<const std::string> labels,
                                     MetricsReport* report) const;

  // Evaluates a step and records the metrics in "report". Returns the
  // predicted classes.
  absl::StatusOr<std::vector<std::string>> EvaluateStep(
      const Step& step, MetricsReport* report) const;

 private:
  ClassificationEvaluator() = default;

  std::vector<std::string> class_list_;
  absl::flat_hash_map<std::string, int> class_indices_;
  absl::optional<double> threshold_;
  bool computes_auc_ = false;
  int auc_decimal_places_ = 0;
};

}  // namespace metric
}  // namespace shard_metrics

#endif  // SHARD_METRICS_METRIC_CLASSIFICATION_H_
