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

#include "shard_metrics/metric/confusion_matrix.h"

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "shard_metrics/utils/logging.h"

namespace shard_metrics {
namespace metric {

absl::string_view ConfusionMatrixViewName(const ConfusionMatrixView view) {
  switch (view) {
    case ConfusionMatrixView::kPrecision:
      return "precision";
    case ConfusionMatrixView::kRecall:
      return "recall";
    case ConfusionMatrixView::kF1:
      return "f1";
  }
  return "unknown";
}

double ConfusionMatrixValue(const ConfusionMatrixView view,
                            const ConfusionCounts& counts) {
  if (counts.true_positives == 0) {
    return 0.0;
  }
  switch (view) {
    case ConfusionMatrixView::kPrecision:
      return counts.true_positives /
             (counts.true_positives + counts.false_positives);
    case ConfusionMatrixView::kRecall:
      return counts.true_positives /
             (counts.true_positives + counts.false_negatives);
    case ConfusionMatrixView::kF1: {
      const double numerator = 2 * counts.true_positives;
      return numerator /
             (numerator + counts.false_negatives + counts.false_positives);
    }
  }
  LOG(FATAL) << "Unknown confusion matrix view";
  return 0.0;
}

PrecisionRecallF1 ComputePrecisionRecallF1(const double true_positives,
                                           const double true_negatives,
                                           const double false_positives,
                                           const double false_negatives) {
  const ConfusionCounts counts{true_positives, true_negatives, false_positives,
                               false_negatives};
  return {PrecisionMetric(counts), RecallMetric(counts),
          ClassificationF1Metric(counts)};
}

absl::StatusOr<PrecisionRecallF1PerExample> ComputePrecisionRecallF1PerExample(
    const absl::Span<const std::string> predictions,
    const absl::Span<const std::string> gold_labels,
    const absl::string_view positive_class) {
  if (predictions.size() != gold_labels.size()) {
    return absl::InvalidArgumentError(
        absl::StrCat("The number of predictions (", predictions.size(),
                     ") does not match the number of labels (",
                     gold_labels.size(), ")"));
  }

  PrecisionRecallF1PerExample metrics;
  metrics.precisions.reserve(predictions.size());
  metrics.recalls.reserve(predictions.size());
  metrics.f1s.reserve(predictions.size());

  for (size_t example_idx = 0; example_idx < predictions.size();
       example_idx++) {
    const bool predicted_positive = predictions[example_idx] == positive_class;
    const bool label_positive = gold_labels[example_idx] == positive_class;
    const auto views = ComputePrecisionRecallF1(
        /*true_positives=*/predicted_positive && label_positive,
        /*true_negatives=*/!predicted_positive && !label_positive,
        /*false_positives=*/predicted_positive && !label_positive,
        /*false_negatives=*/!predicted_positive && label_positive);
    metrics.precisions.push_back(views.precision);
    metrics.recalls.push_back(views.recall);
    metrics.f1s.push_back(views.f1);
  }
  return metrics;
}

}  // namespace metric
}  // namespace shard_metrics
