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

#include "shard_metrics/metric/auc.h"

#include <stdint.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/strings/substitute.h"
#include "absl/types/span.h"
#include "shard_metrics/utils/logging.h"

namespace shard_metrics {
namespace metric {

namespace {

double RocFPR(const RocBucket& bucket, const int64_t negative_count) {
  return static_cast<double>(bucket.false_positives) / negative_count;
}

double RocTPR(const RocBucket& bucket, const int64_t positive_count) {
  return static_cast<double>(bucket.true_positives) / positive_count;
}

}  // namespace

namespace internal {

std::vector<double> MergeSortedWithoutDuplicates(
    const absl::Span<const double> a, const absl::Span<const double> b) {
  std::vector<double> merged;
  merged.reserve(a.size() + b.size());
  size_t idx_a = 0;
  size_t idx_b = 0;
  while (idx_a < a.size() && idx_b < b.size()) {
    const double current_min = std::min(a[idx_a], b[idx_b]);
    if (a[idx_a] == current_min) {
      idx_a++;
    }
    if (b[idx_b] == current_min) {
      idx_b++;
    }
    merged.push_back(current_min);
  }
  merged.insert(merged.end(), a.begin() + idx_a, a.end());
  merged.insert(merged.end(), b.begin() + idx_b, b.end());
  return merged;
}

std::pair<double, double> EnclosingThresholds(const double probability,
                                              const int decimal_places) {
  const double scale = std::pow(10.0, decimal_places);
  const double scaled = probability * scale;
  double lower = std::floor(scaled) / scale;
  double upper = std::ceil(scaled) / scale;
  // The rounding of "probability * scale" can push a grid value to the wrong
  // side of the probability.
  if (lower > probability) {
    lower = (std::floor(scaled) - 1) / scale;
  }
  if (upper < probability) {
    upper = (std::ceil(scaled) + 1) / scale;
  }
  return {lower, upper};
}

}  // namespace internal

AUCMetrics::AUCMetrics(const absl::string_view class_label,
                       std::vector<double> thresholds,
                       std::vector<RocBucket> buckets,
                       const int64_t positive_count,
                       const int64_t negative_count)
    : class_label_(class_label),
      thresholds_(std::move(thresholds)),
      buckets_(std::move(buckets)),
      positive_count_(positive_count),
      negative_count_(negative_count) {
  DCHECK_EQ(thresholds_.size(), buckets_.size());
}

absl::StatusOr<AUCMetrics> AUCMetrics::FromRawData(
    const absl::Span<const std::string> true_labels,
    const absl::Span<const double> class_probabilities,
    const absl::string_view class_label, const int decimal_places) {
  if (true_labels.size() != class_probabilities.size()) {
    return absl::InvalidArgumentError(
        absl::StrCat("The number of labels (", true_labels.size(),
                     ") does not match the number of probabilities (",
                     class_probabilities.size(), ")"));
  }
  if (decimal_places < 0 || decimal_places > kMaxDecimalPlaces) {
    return absl::InvalidArgumentError(
        absl::Substitute("The number of decimal places should be in [0, $0]. "
                         "Got $1 instead.",
                         kMaxDecimalPlaces, decimal_places));
  }
  for (const double probability : class_probabilities) {
    // Note: Also rejects NaNs.
    if (!(probability >= 0.0 && probability <= 1.0)) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Probabilities should be in [0, 1]. Got ", probability, " instead."));
    }
  }

  if (class_probabilities.empty()) {
    return AUCMetrics(class_label);
  }

  int64_t positive_count = 0;
  for (const auto& label : true_labels) {
    if (label == class_label) {
      positive_count++;
    }
  }
  const int64_t negative_count = true_labels.size() - positive_count;

  // The grid contains the two quantized values enclosing each probability, and
  // the sentinel. The lower bound of the grid does not need a sentinel as the
  // buckets count the predictions greater or equal to the threshold.
  std::vector<double> thresholds;
  thresholds.reserve(2 * class_probabilities.size() + 1);
  thresholds.push_back(kSentinelThreshold);
  for (const double probability : class_probabilities) {
    const auto enclosing =
        internal::EnclosingThresholds(probability, decimal_places);
    thresholds.push_back(enclosing.first);
    thresholds.push_back(enclosing.second);
  }
  std::sort(thresholds.begin(), thresholds.end());
  thresholds.erase(std::unique(thresholds.begin(), thresholds.end()),
                   thresholds.end());

  // An example is counted in the buckets of all the thresholds lower or equal
  // to its probability. The examples are first counted in the bucket of the
  // greatest such threshold, and the counts are then accumulated from the top
  // of the grid.
  std::vector<RocBucket> buckets(thresholds.size());
  for (size_t example_idx = 0; example_idx < true_labels.size();
       example_idx++) {
    const double probability = class_probabilities[example_idx];
    const auto num_thresholds_below =
        std::upper_bound(thresholds.begin(), thresholds.end(), probability) -
        thresholds.begin();
    DCHECK_GT(num_thresholds_below, 0);
    auto& bucket = buckets[num_thresholds_below - 1];
    if (true_labels[example_idx] == class_label) {
      bucket.true_positives++;
    } else {
      bucket.false_positives++;
    }
  }
  for (int threshold_idx = static_cast<int>(buckets.size()) - 2;
       threshold_idx >= 0; threshold_idx--) {
    buckets[threshold_idx].false_positives +=
        buckets[threshold_idx + 1].false_positives;
    buckets[threshold_idx].true_positives +=
        buckets[threshold_idx + 1].true_positives;
  }

  return AUCMetrics(class_label, std::move(thresholds), std::move(buckets),
                    positive_count, negative_count);
}

absl::StatusOr<AUCMetrics> AUCMetrics::Create(
    const absl::string_view class_label, std::vector<double> thresholds,
    std::vector<RocBucket> buckets, const int64_t positive_count,
    const int64_t negative_count) {
  if (thresholds.size() != buckets.size()) {
    return absl::InvalidArgumentError(absl::Substitute(
        "The number of thresholds ($0) does not match the number of buckets "
        "($1)",
        thresholds.size(), buckets.size()));
  }
  if (positive_count < 0 || negative_count < 0) {
    return absl::InvalidArgumentError(absl::Substitute(
        "Negative example count: $0 positive and $1 negative examples",
        positive_count, negative_count));
  }
  if (thresholds.empty() && positive_count + negative_count > 0) {
    return absl::InvalidArgumentError(
        "An accumulator with examples should have a threshold grid");
  }
  for (size_t threshold_idx = 0; threshold_idx < thresholds.size();
       threshold_idx++) {
    const auto& bucket = buckets[threshold_idx];
    if (bucket.false_positives < 0 || bucket.false_positives > negative_count ||
        bucket.true_positives < 0 || bucket.true_positives > positive_count) {
      return absl::InvalidArgumentError(absl::Substitute(
          "The bucket of threshold $0 is out of the example counts",
          thresholds[threshold_idx]));
    }
    if (threshold_idx == 0) {
      continue;
    }
    if (!(thresholds[threshold_idx - 1] < thresholds[threshold_idx])) {
      return absl::InvalidArgumentError(
          "The thresholds should be sorted and unique");
    }
    const auto& previous_bucket = buckets[threshold_idx - 1];
    if (bucket.false_positives > previous_bucket.false_positives ||
        bucket.true_positives > previous_bucket.true_positives) {
      return absl::InvalidArgumentError(absl::Substitute(
          "The buckets should not increase with the threshold. Threshold $0 "
          "has more examples than threshold $1",
          thresholds[threshold_idx], thresholds[threshold_idx - 1]));
    }
  }
  if (!thresholds.empty()) {
    // Every example is above the lowest threshold and below the highest one.
    if (!(buckets.front() == RocBucket{negative_count, positive_count})) {
      return absl::InvalidArgumentError(absl::Substitute(
          "The bucket of the lowest threshold $0 should count all the $1 "
          "negative and $2 positive examples",
          thresholds.front(), negative_count, positive_count));
    }
    if (!(buckets.back() == RocBucket{0, 0})) {
      return absl::InvalidArgumentError(absl::Substitute(
          "The bucket of the highest threshold $0 should be empty",
          thresholds.back()));
    }
  }
  for (const double threshold : thresholds) {
    if (!std::isfinite(threshold)) {
      return absl::InvalidArgumentError(
          absl::StrCat("Non finite threshold ", threshold));
    }
  }
  return AUCMetrics(class_label, std::move(thresholds), std::move(buckets),
                    positive_count, negative_count);
}

absl::StatusOr<double> AUCMetrics::ComputeAuc() const {
  if (positive_count_ == 0 || negative_count_ == 0) {
    return absl::FailedPreconditionError(absl::Substitute(
        "The AUC of class \"$0\" is not defined with $1 positive and $2 "
        "negative examples",
        class_label_, positive_count_, negative_count_));
  }

  // The thresholds are sorted in increasing order, so the false positive rate
  // decreases along the curve: The curve goes from (1,1) to (0,0).
  double auc = 0.0;
  for (size_t threshold_idx = 0; threshold_idx + 1 < buckets_.size();
       threshold_idx++) {
    const auto& cur = buckets_[threshold_idx];
    const auto& next = buckets_[threshold_idx + 1];
    auc += (RocFPR(cur, negative_count_) - RocFPR(next, negative_count_)) *
           (RocTPR(next, positive_count_) + RocTPR(cur, positive_count_)) / 2;
  }
  return auc;
}

double AUCMetrics::Value() const {
  const auto auc = ComputeAuc();
  CHECK_OK(auc.status());
  return auc.value();
}

absl::StatusOr<AUCMetrics> AUCMetrics::Merge(const AUCMetrics& other) const {
  if (class_label_ != other.class_label_) {
    return absl::InvalidArgumentError(absl::Substitute(
        "Cannot merge the AUC of class \"$0\" with the AUC of class \"$1\"",
        class_label_, other.class_label_));
  }

  std::vector<double> thresholds =
      internal::MergeSortedWithoutDuplicates(thresholds_, other.thresholds_);
  std::vector<RocBucket> buckets;
  buckets.reserve(thresholds.size());
  for (const double threshold : thresholds) {
    const auto bucket = Bucket(threshold);
    const auto other_bucket = other.Bucket(threshold);
    buckets.push_back(
        {bucket.false_positives + other_bucket.false_positives,
         bucket.true_positives + other_bucket.true_positives});
  }
  return AUCMetrics(class_label_, std::move(thresholds), std::move(buckets),
                    positive_count_ + other.positive_count_,
                    negative_count_ + other.negative_count_);
}

RocBucket AUCMetrics::Bucket(const double threshold) const {
  if (thresholds_.empty()) {
    return {};
  }
  // Buckets are constant between two grid thresholds. If "threshold" is not in
  // the grid, the first grid threshold above it has the same bucket.
  const auto it =
      std::lower_bound(thresholds_.begin(), thresholds_.end(), threshold);
  if (it == thresholds_.end()) {
    return buckets_.back();
  }
  return buckets_[it - thresholds_.begin()];
}

}  // namespace metric
}  // namespace shard_metrics
