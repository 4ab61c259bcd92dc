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

// Mergeable accumulator of the area under the ROC curve of a "one-vs-others"
// binary classifier.
//
// The predicted probabilities are quantized on a grid of thresholds with a
// fixed number of decimal places. For each threshold, the accumulator stores
// the number of negative and positive examples with a predicted probability
// greater or equal to the threshold (i.e. the false positives and true
// positives of the classifier using this threshold). Two accumulators built
// on different examples (and therefore on different grids) are merged exactly:
// the merged grid is the union of the two grids. The size of the grid is
// bounded by the number of distinct quantized probabilities, not by the
// number of merges.
//
// Usage example:
//   absl::optional<AUCMetrics> auc;
//   for (const auto& batch : batches) {
//     ASSIGN_OR_RETURN(const auto batch_auc,
//                      AUCMetrics::FromRawData(batch.labels,
//                                              batch.probabilities, "yes"));
//     RETURN_IF_ERROR(MergeInto(batch_auc, &auc));
//   }
//   ASSIGN_OR_RETURN(const double value, auc->ComputeAuc());

#ifndef SHARD_METRICS_METRIC_AUC_H_
#define SHARD_METRICS_METRIC_AUC_H_

#include <stdint.h>

#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "shard_metrics/metric/metric.h"

namespace shard_metrics {
namespace metric {

// False positives and true positives for the examples with a predicted
// probability greater or equal to a threshold.
struct RocBucket {
  int64_t false_positives = 0;
  int64_t true_positives = 0;

  bool operator==(const RocBucket& other) const {
    return false_positives == other.false_positives &&
           true_positives == other.true_positives;
  }
};

class AUCMetrics final : public Metric {
 public:
  // Threshold greater than any probability. No example is predicted positive
  // at this threshold.
  static constexpr double kSentinelThreshold = 1.5;

  static constexpr int kDefaultDecimalPlaces = 3;

  // Largest supported number of decimal places for the threshold grid.
  static constexpr int kMaxDecimalPlaces = 9;

  // Accumulator without any example. Identity element of "Merge".
  explicit AUCMetrics(absl::string_view class_label)
      : class_label_(class_label) {}

  // Builds the accumulator from labels and the predicted probability of
  // "class_label". Examples with a label equal to "class_label" are positive,
  // the other examples are negative. Fails if "true_labels" and
  // "class_probabilities" have different sizes, if a probability is not in
  // [0, 1], or if "decimal_places" is not in [0, kMaxDecimalPlaces].
  static absl::StatusOr<AUCMetrics> FromRawData(
      absl::Span<const std::string> true_labels,
      absl::Span<const double> class_probabilities,
      absl::string_view class_label,
      int decimal_places = kDefaultDecimalPlaces);

  // Builds the accumulator from its internal representation e.g. after
  // deserialization. Fails if the representation is not consistent.
  static absl::StatusOr<AUCMetrics> Create(absl::string_view class_label,
                                           std::vector<double> thresholds,
                                           std::vector<RocBucket> buckets,
                                           int64_t positive_count,
                                           int64_t negative_count);

  // Area under the ROC curve. Fails with a FailedPrecondition error if there
  // are no positive or no negative examples, in which case the AUC is not
  // defined.
  absl::StatusOr<double> ComputeAuc() const;

  // Same as "ComputeAuc", but crashes when the AUC is not defined. Callers
  // should not request the AUC when one of the classes is absent.
  double Value() const override;

  bool MacroAverage() const override { return false; }

  // Merges two accumulators. Fails if they are not for the same class.
  absl::StatusOr<AUCMetrics> Merge(const AUCMetrics& other) const;

  // False positives and true positives at "threshold". If "threshold" is not
  // part of the grid, returns the bucket of the smallest grid threshold
  // greater than "threshold", or of the last grid threshold if there are
  // none. Returns an empty bucket if the grid is empty.
  RocBucket Bucket(double threshold) const;

  const std::string& class_label() const { return class_label_; }
  const std::vector<double>& thresholds() const { return thresholds_; }
  const std::vector<RocBucket>& buckets() const { return buckets_; }
  int64_t positive_count() const { return positive_count_; }
  int64_t negative_count() const { return negative_count_; }

 private:
  AUCMetrics(absl::string_view class_label, std::vector<double> thresholds,
             std::vector<RocBucket> buckets, int64_t positive_count,
             int64_t negative_count);

  std::string class_label_;

  // Sorted and unique thresholds.
  std::vector<double> thresholds_;

  // "buckets_[i]" is the bucket of "thresholds_[i]".
  std::vector<RocBucket> buckets_;

  int64_t positive_count_ = 0;
  int64_t negative_count_ = 0;
};

namespace internal {

// Union of two sorted sequences without duplicates. The output is sorted and
// without duplicates.
std::vector<double> MergeSortedWithoutDuplicates(absl::Span<const double> a,
                                                 absl::Span<const double> b);

// Thresholds enclosing "probability" on the grid with "decimal_places"
// decimal places i.e. the probability rounded down and rounded up.
std::pair<double, double> EnclosingThresholds(double probability,
                                              int decimal_places);

}  // namespace internal

}  // namespace metric
}  // namespace shard_metrics

#endif  // SHARD_METRICS_METRIC_AUC_H_
