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

#include "shard_metrics/metric/weighted_f1.h"

#include <map>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/types/optional.h"
#include "shard_metrics/metric/confusion_matrix.h"
#include "shard_metrics/metric/metric.h"
#include "shard_metrics/utils/test.h"

namespace shard_metrics {
namespace metric {
namespace {

using test::StatusIs;
using testing::ElementsAre;
using testing::Pair;

// Per example weighted F1s of a set of predictions.
std::vector<WeightedF1Metric> PerExampleWeightedF1(
    const std::vector<std::string>& classes,
    const std::vector<std::string>& predictions,
    const std::vector<std::string>& labels) {
  std::map<std::string, std::vector<ClassificationF1Metric>> f1s_per_class;
  for (const auto& class_label : classes) {
    f1s_per_class[class_label] =
        ComputePrecisionRecallF1PerExample(predictions, labels, class_label)
            .value()
            .f1s;
  }
  return WeightedF1Metric::ComputeMany(f1s_per_class).value();
}

WeightedF1Metric Sum(const std::vector<WeightedF1Metric>& metrics) {
  WeightedF1Metric sum;
  for (const auto& metric : metrics) {
    sum = sum + metric;
  }
  return sum;
}

TEST(WeightedF1, Balanced) {
  const auto metrics = PerExampleWeightedF1({"A", "B"}, {"A", "A", "B", "B"},
                                            {"A", "B", "B", "A"});
  ASSERT_EQ(metrics.size(), 4);
  EXPECT_NEAR(Sum(metrics).Value(), 0.5, 1e-9);
}

TEST(WeightedF1, Unbalanced) {
  // Class A: TP=2 FP=1 FN=1 i.e. F1=2/3 with 3 examples.
  // Class B: TP=0 i.e. F1=0 with 1 example.
  const auto metrics = PerExampleWeightedF1({"A", "B"}, {"A", "A", "B", "A"},
                                            {"A", "A", "A", "B"});
  EXPECT_NEAR(Sum(metrics).Value(), 2. / 3. * 3. / 4., 1e-9);
}

TEST(WeightedF1, FromCounts) {
  // "A" has a perfect F1 and "B" has no true positives.
  const WeightedF1Metric metric({{"A", ClassificationF1Metric(1, 1, 0, 0)},
                                 {"B", ClassificationF1Metric(0, 1, 0, 1)}});
  EXPECT_NEAR(metric.Value(), 0.5, 1e-9);
}

TEST(WeightedF1, Empty) {
  EXPECT_EQ(WeightedF1Metric().Value(), 0.0);
  EXPECT_TRUE(WeightedF1Metric().MacroAverage());
}

TEST(WeightedF1, MergeIsUnionOfClasses) {
  const WeightedF1Metric a({{"A", ClassificationF1Metric(1, 1, 0, 0)},
                            {"B", ClassificationF1Metric(1, 1, 0, 0)}});
  const WeightedF1Metric b({{"B", ClassificationF1Metric(0, 1, 1, 0)},
                            {"C", ClassificationF1Metric(0, 2, 0, 0)}});
  ASSERT_OK_AND_ASSIGN(const auto merged, a.Merge(b));
  EXPECT_THAT(merged.f1_per_class(),
              ElementsAre(Pair("A", testing::_), Pair("B", testing::_),
                          Pair("C", testing::_)));
  EXPECT_EQ(merged.f1_per_class().at("A").counts(),
            (ConfusionCounts{1, 1, 0, 0}));
  EXPECT_EQ(merged.f1_per_class().at("B").counts(),
            (ConfusionCounts{1, 2, 1, 0}));
  EXPECT_EQ(merged.f1_per_class().at("C").counts(),
            (ConfusionCounts{0, 2, 0, 0}));

  ASSERT_OK_AND_ASSIGN(const auto merged_other_way, b.Merge(a));
  EXPECT_NEAR(merged.Value(), merged_other_way.Value(), 1e-9);
}

TEST(WeightedF1, MergeWithAbsentIsIdentity) {
  const WeightedF1Metric metric({{"A", ClassificationF1Metric(1, 1, 0, 0)},
                                 {"B", ClassificationF1Metric(0, 1, 1, 0)}});
  ASSERT_OK_AND_ASSIGN(const auto merged,
                       Merge(metric, absl::optional<WeightedF1Metric>()));
  ASSERT_EQ(merged.f1_per_class().size(), 2);
  EXPECT_EQ(merged.f1_per_class().at("A").counts(),
            (ConfusionCounts{1, 1, 0, 0}));
  EXPECT_EQ(merged.f1_per_class().at("B").counts(),
            (ConfusionCounts{0, 1, 1, 0}));
  EXPECT_NEAR(merged.Value(), metric.Value(), 1e-9);

  absl::optional<WeightedF1Metric> accumulator;
  ASSERT_OK(MergeInto(metric, &accumulator));
  ASSERT_TRUE(accumulator.has_value());
  EXPECT_NEAR(accumulator->Value(), metric.Value(), 1e-9);
}

TEST(WeightedF1, MergedShardsEqualsBatch) {
  const std::vector<std::string> classes = {"A", "B", "C"};
  const std::vector<std::string> predictions = {"A", "B", "C", "A",
                                                "B", "C", "C"};
  const std::vector<std::string> labels = {"A", "A", "C", "B", "B", "A", "C"};
  const auto metrics = PerExampleWeightedF1(classes, predictions, labels);

  WeightedF1Metric shard_1;
  WeightedF1Metric shard_2;
  for (int example_idx = 0; example_idx < metrics.size(); example_idx++) {
    auto& shard = (example_idx < 3) ? shard_1 : shard_2;
    shard = shard + metrics[example_idx];
  }
  EXPECT_NEAR((shard_1 + shard_2).Value(), Sum(metrics).Value(), 1e-9);
}

TEST(WeightedF1, ComputeManyZipsTheClasses) {
  std::map<std::string, std::vector<ClassificationF1Metric>> f1s_per_class;
  f1s_per_class["A"] = {ClassificationF1Metric(1, 0, 0, 0),
                        ClassificationF1Metric(0, 1, 0, 0)};
  f1s_per_class["B"] = {ClassificationF1Metric(0, 1, 0, 0),
                        ClassificationF1Metric(1, 0, 0, 0)};
  ASSERT_OK_AND_ASSIGN(const auto metrics,
                       WeightedF1Metric::ComputeMany(f1s_per_class));
  ASSERT_EQ(metrics.size(), 2);
  EXPECT_EQ(metrics[1].f1_per_class().at("A").counts(),
            (ConfusionCounts{0, 1, 0, 0}));
  EXPECT_EQ(metrics[1].f1_per_class().at("B").counts(),
            (ConfusionCounts{1, 0, 0, 0}));
  EXPECT_NEAR(metrics[0].Value(), 1.0, 1e-9);
}

TEST(WeightedF1, ComputeManyDifferentSizes) {
  std::map<std::string, std::vector<ClassificationF1Metric>> f1s_per_class;
  f1s_per_class["A"] = {ClassificationF1Metric(1, 0, 0, 0)};
  f1s_per_class["B"] = {};
  EXPECT_THAT(WeightedF1Metric::ComputeMany(f1s_per_class).status(),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

}  // namespace
}  // namespace metric
}  // namespace shard_metrics
