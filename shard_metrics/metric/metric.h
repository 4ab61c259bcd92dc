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

// Interface shared by all the metric accumulators.
//
// An accumulator summarizes a set of predictions (e.g. the predictions of a
// batch, or of a worker) and can be merged with another accumulator of the
// same type computed on another set of predictions. Accumulators are immutable
// values: merging returns a new accumulator. Merging is associative and
// commutative, and merging with an absent accumulator is the identity. The
// metric value is only extracted at reporting time.

#ifndef SHARD_METRICS_METRIC_METRIC_H_
#define SHARD_METRICS_METRIC_METRIC_H_

#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/optional.h"

namespace shard_metrics {
namespace metric {

class Metric {
 public:
  virtual ~Metric() = default;

  // Value of the metric on all the predictions summarized by the accumulator.
  virtual double Value() const = 0;

  // If true, the value reported over a set of shards is the unweighted mean of
  // the shard values (macro-average). If false, the shards are merged, and the
  // value is computed once on the merged accumulator (micro-average).
  virtual bool MacroAverage() const = 0;
};

// Merges two accumulators of the same type. An absent "b" is the identity.
template <typename T>
absl::StatusOr<T> Merge(const T& a, const absl::optional<T>& b) {
  if (!b.has_value()) {
    return a;
  }
  return a.Merge(*b);
}

// Merges "src" into the optional accumulator "dst". An absent "dst" becomes
// "src".
template <typename T>
absl::Status MergeInto(const T& src, absl::optional<T>* dst) {
  if (!dst->has_value()) {
    *dst = src;
    return absl::OkStatus();
  }
  auto merged = (*dst)->Merge(src);
  if (!merged.ok()) {
    return merged.status();
  }
  *dst = std::move(merged).value();
  return absl::OkStatus();
}

}  // namespace metric
}  // namespace shard_metrics

#endif  // SHARD_METRICS_METRIC_METRIC_H_
