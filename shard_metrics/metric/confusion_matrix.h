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

// Binary confusion matrix accumulators: precision, recall and F1.
//
// The three metrics share the same representation (the four cells of a binary
// confusion matrix) and the same merge operation (cell-wise sum). They only
// differ in the way the metric value is extracted. Each view is a distinct
// type, so a precision cannot be merged with a recall.
//
// Usage example:
//   ASSIGN_OR_RETURN(const auto metrics,
//                    ComputePrecisionRecallF1PerExample(predictions, labels,
//                                                       "positive"));
//   ClassificationF1Metric f1;
//   for (const auto& item : metrics.f1s) {
//     f1 = f1 + item;
//   }
//   LOG(INFO) << "F1: " << f1.Value();

#ifndef SHARD_METRICS_METRIC_CONFUSION_MATRIX_H_
#define SHARD_METRICS_METRIC_CONFUSION_MATRIX_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "shard_metrics/metric/metric.h"
#include "shard_metrics/utils/logging.h"

namespace shard_metrics {
namespace metric {

// The way a confusion matrix is turned into a metric value.
enum class ConfusionMatrixView {
  kPrecision,
  kRecall,
  kF1,
};

// Human readable name of a view e.g. "precision".
absl::string_view ConfusionMatrixViewName(ConfusionMatrixView view);

// Cells of a binary confusion matrix. The cells can be integer counts or sums
// of example weights.
struct ConfusionCounts {
  double true_positives = 0;
  double true_negatives = 0;
  double false_positives = 0;
  double false_negatives = 0;

  // Number (or weight) of examples with a positive label.
  double ActualPositives() const { return true_positives + false_negatives; }

  // Number (or weight) of examples.
  double Total() const {
    return true_positives + true_negatives + false_positives + false_negatives;
  }

  ConfusionCounts operator+(const ConfusionCounts& other) const {
    return {true_positives + other.true_positives,
            true_negatives + other.true_negatives,
            false_positives + other.false_positives,
            false_negatives + other.false_negatives};
  }

  bool operator==(const ConfusionCounts& other) const {
    return true_positives == other.true_positives &&
           true_negatives == other.true_negatives &&
           false_positives == other.false_positives &&
           false_negatives == other.false_negatives;
  }
};

// Value of a confusion matrix for a given view. All the views are 0 when there
// are no true positives.
double ConfusionMatrixValue(ConfusionMatrixView view,
                            const ConfusionCounts& counts);

template <ConfusionMatrixView kView>
class ConfusionMatrixMetric final : public Metric {
 public:
  static constexpr ConfusionMatrixView kViewType = kView;

  ConfusionMatrixMetric() = default;

  ConfusionMatrixMetric(const double true_positives,
                        const double true_negatives,
                        const double false_positives,
                        const double false_negatives)
      : ConfusionMatrixMetric(ConfusionCounts{true_positives, true_negatives,
                                              false_positives,
                                              false_negatives}) {}

  explicit ConfusionMatrixMetric(const ConfusionCounts& counts)
      : counts_(counts) {
    CHECK_GE(counts_.true_positives, 0);
    CHECK_GE(counts_.true_negatives, 0);
    CHECK_GE(counts_.false_positives, 0);
    CHECK_GE(counts_.false_negatives, 0);
  }

  double Value() const override { return ConfusionMatrixValue(kView, counts_); }

  bool MacroAverage() const override { return true; }

  ConfusionMatrixMetric operator+(const ConfusionMatrixMetric& other) const {
    return ConfusionMatrixMetric(counts_ + other.counts_);
  }

  // Never fails. Exposed for the generic "Merge" functions.
  absl::StatusOr<ConfusionMatrixMetric> Merge(
      const ConfusionMatrixMetric& other) const {
    return *this + other;
  }

  const ConfusionCounts& counts() const { return counts_; }
  double true_positives() const { return counts_.true_positives; }
  double true_negatives() const { return counts_.true_negatives; }
  double false_positives() const { return counts_.false_positives; }
  double false_negatives() const { return counts_.false_negatives; }

 private:
  ConfusionCounts counts_;
};

using PrecisionMetric = ConfusionMatrixMetric<ConfusionMatrixView::kPrecision>;
using RecallMetric = ConfusionMatrixMetric<ConfusionMatrixView::kRecall>;
using ClassificationF1Metric = ConfusionMatrixMetric<ConfusionMatrixView::kF1>;

// The three views of the same confusion matrix.
struct PrecisionRecallF1 {
  PrecisionMetric precision;
  RecallMetric recall;
  ClassificationF1Metric f1;
};

PrecisionRecallF1 ComputePrecisionRecallF1(double true_positives,
                                           double true_negatives,
                                           double false_positives,
                                           double false_negatives);

// One metric of each view per example.
struct PrecisionRecallF1PerExample {
  std::vector<PrecisionMetric> precisions;
  std::vector<RecallMetric> recalls;
  std::vector<ClassificationF1Metric> f1s;
};

// Computes the precision, recall and F1 of each example independently.
// "positive_class" is the positive class, all the other labels are negative.
// Fails if "predictions" and "gold_labels" have different sizes.
absl::StatusOr<PrecisionRecallF1PerExample> ComputePrecisionRecallF1PerExample(
    absl::Span<const std::string> predictions,
    absl::Span<const std::string> gold_labels,
    absl::string_view positive_class);

}  // namespace metric
}  // namespace shard_metrics

#endif  // SHARD_METRICS_METRIC_CONFUSION_MATRIX_H_
