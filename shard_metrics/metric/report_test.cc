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

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "shard_metrics/utils/test.h"

namespace shard_metrics {
namespace metric {
namespace {

using test::StatusIs;
using testing::DoubleNear;
using testing::ElementsAre;
using testing::Pair;

TEST(MetricsReport, RecordAndValue) {
  MetricsReport report;
  EXPECT_TRUE(report.empty());
  ASSERT_OK(report.Record("precision", PrecisionMetric(1, 0, 1, 0)));
  ASSERT_OK(report.Record("precision", PrecisionMetric(2, 0, 0, 0)));
  ASSERT_OK(report.RecordMany("loss", AverageMetric::Many({1, 2, 3, 6})));
  EXPECT_FALSE(report.empty());

  ASSERT_OK_AND_ASSIGN(const double precision, report.Value("precision"));
  EXPECT_NEAR(precision, 0.75, 1e-9);
  ASSERT_OK_AND_ASSIGN(const double loss, report.Value("loss"));
  EXPECT_NEAR(loss, 3.0, 1e-9);

  ASSERT_OK_AND_ASSIGN(const bool precision_macro,
                       report.MacroAverage("precision"));
  EXPECT_TRUE(precision_macro);
  ASSERT_OK_AND_ASSIGN(const bool loss_macro, report.MacroAverage("loss"));
  EXPECT_FALSE(loss_macro);

  EXPECT_THAT(report.Names(), ElementsAre("loss", "precision"));
  ASSERT_NE(report.Find("loss"), nullptr);
  EXPECT_EQ(MetricTypeName(*report.Find("loss")), "average");
  EXPECT_EQ(report.Find("other"), nullptr);
}

TEST(MetricsReport, UnknownMetric) {
  MetricsReport report;
  EXPECT_THAT(report.Value("missing").status(),
              StatusIs(absl::StatusCode::kNotFound, "missing"));
  EXPECT_THAT(report.MacroAverage("missing").status(),
              StatusIs(absl::StatusCode::kNotFound));
}

TEST(MetricsReport, TypeMismatch) {
  MetricsReport report;
  ASSERT_OK(report.Record("m", PrecisionMetric(1, 0, 0, 0)));
  EXPECT_THAT(report.Record("m", RecallMetric(1, 0, 0, 0)),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Cannot merge a \"precision\" metric with a \"recall\" "
                       "metric"));
  EXPECT_THAT(report.Record("m", AverageMetric(1, 1)),
              StatusIs(absl::StatusCode::kInvalidArgument, "\"m\""));

  // The recorded metric is unchanged.
  ASSERT_OK_AND_ASSIGN(const double value, report.Value("m"));
  EXPECT_NEAR(value, 1.0, 1e-9);
}

TEST(MetricsReport, AucMismatch) {
  MetricsReport report;
  ASSERT_OK(report.Record("auc", AUCMetrics("a")));
  EXPECT_THAT(report.Record("auc", AUCMetrics("b")),
              StatusIs(absl::StatusCode::kInvalidArgument, "class"));
}

TEST(MetricsReport, MergeFrom) {
  MetricsReport a;
  ASSERT_OK(a.Record("f1", ClassificationF1Metric(1, 0, 1, 0)));
  MetricsReport b;
  ASSERT_OK(b.Record("f1", ClassificationF1Metric(1, 0, 0, 0)));
  ASSERT_OK(b.Record("loss", AverageMetric(4, 2)));
  ASSERT_OK(a.MergeFrom(b));
  EXPECT_THAT(a.Names(), ElementsAre("f1", "loss"));
  ASSERT_OK_AND_ASSIGN(const double f1, a.Value("f1"));
  EXPECT_NEAR(f1, 4. / 5., 1e-9);
}

TEST(MetricsReport, FailedMergeFromLeavesReportUnchanged) {
  MetricsReport report;
  ASSERT_OK(report.Record("loss", AverageMetric(4, 2)));
  ASSERT_OK(report.Record("weighted_f1", WeightedF1Metric()));

  // "loss" and "new" come before the conflicting "weighted_f1".
  MetricsReport other;
  ASSERT_OK(other.Record("loss", AverageMetric(10, 2)));
  ASSERT_OK(other.Record("new", AverageMetric(1, 1)));
  ASSERT_OK(other.Record("weighted_f1", AverageMetric(1, 1)));
  EXPECT_THAT(report.MergeFrom(other),
              StatusIs(absl::StatusCode::kInvalidArgument, "\"weighted_f1\""));

  EXPECT_THAT(report.Names(), ElementsAre("loss", "weighted_f1"));
  ASSERT_OK_AND_ASSIGN(const double loss, report.Value("loss"));
  EXPECT_NEAR(loss, 2.0, 1e-9);
  EXPECT_EQ(MetricTypeName(*report.Find("weighted_f1")), "weighted_f1");
}

TEST(MetricValue, MergeMetricValues) {
  ASSERT_OK_AND_ASSIGN(
      const auto merged,
      MergeMetricValues(AverageMetric(1, 1), AverageMetric(3, 1)));
  ASSERT_OK_AND_ASSIGN(const double value, ComputeMetricValue(merged));
  EXPECT_NEAR(value, 2.0, 1e-9);

  EXPECT_THAT(MergeMetricValues(WeightedF1Metric(), AUCMetrics("a")).status(),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Cannot merge a \"weighted_f1\" metric with a \"auc\" "
                       "metric"));
}

TEST(MetricValue, UndefinedAuc) {
  EXPECT_THAT(ComputeMetricValue(AUCMetrics("a")).status(),
              StatusIs(absl::StatusCode::kFailedPrecondition));
}

TEST(AggregateShardReports, MacroAndMicroAverage) {
  MetricsReport shard_1;
  ASSERT_OK(shard_1.Record("precision", PrecisionMetric(1, 0, 0, 0)));
  ASSERT_OK(shard_1.Record("loss", AverageMetric(2, 1)));
  MetricsReport shard_2;
  ASSERT_OK(shard_2.Record("precision", PrecisionMetric(1, 0, 3, 0)));
  ASSERT_OK(shard_2.Record("loss", AverageMetric(0, 3)));

  ASSERT_OK_AND_ASSIGN(const auto values,
                       AggregateShardReports({shard_1, shard_2}));
  EXPECT_THAT(values, ElementsAre(
                          // Merged accumulators i.e. 2 / 4.
                          Pair("loss", DoubleNear(0.5, 1e-9)),
                          // Mean of the shard values i.e. (1 + 1/4) / 2.
                          Pair("precision", DoubleNear(0.625, 1e-9))));
}

TEST(AggregateShardReports, MetricInSomeShards) {
  MetricsReport shard_1;
  ASSERT_OK(shard_1.Record("recall", RecallMetric(1, 0, 0, 1)));
  MetricsReport shard_2;
  ASSERT_OK(shard_2.Record("recall", RecallMetric(1, 0, 0, 0)));
  MetricsReport shard_3;
  ASSERT_OK(shard_3.Record("loss", AverageMetric(1, 1)));

  ASSERT_OK_AND_ASSIGN(const auto values,
                       AggregateShardReports({shard_1, shard_2, shard_3}));
  EXPECT_THAT(values, ElementsAre(Pair("loss", DoubleNear(1.0, 1e-9)),
                                  Pair("recall", DoubleNear(0.75, 1e-9))));
}

TEST(AggregateShardReports, AucIsComputedOnTheMergedCurve) {
  // Each shard only sees one of the classes.
  MetricsReport shard_1;
  ASSERT_OK_AND_ASSIGN(const auto auc_1,
                       AUCMetrics::FromRawData({"pos"}, {0.9}, "pos"));
  ASSERT_OK(shard_1.Record("auc", auc_1));
  MetricsReport shard_2;
  ASSERT_OK_AND_ASSIGN(const auto auc_2,
                       AUCMetrics::FromRawData({"neg"}, {0.2}, "pos"));
  ASSERT_OK(shard_2.Record("auc", auc_2));

  EXPECT_THAT(shard_1.Value("auc").status(),
              StatusIs(absl::StatusCode::kFailedPrecondition));
  ASSERT_OK_AND_ASSIGN(const auto values,
                       AggregateShardReports({shard_1, shard_2}));
  EXPECT_THAT(values, ElementsAre(Pair("auc", DoubleNear(1.0, 1e-9))));
}

TEST(AggregateShardReports, TypeMismatchBetweenShards) {
  MetricsReport shard_1;
  ASSERT_OK(shard_1.Record("m", PrecisionMetric(1, 0, 0, 0)));
  MetricsReport shard_2;
  ASSERT_OK(shard_2.Record("m", ClassificationF1Metric(1, 0, 0, 0)));
  EXPECT_THAT(AggregateShardReports({shard_1, shard_2}).status(),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(AggregateShardReports, NoShards) {
  ASSERT_OK_AND_ASSIGN(const auto values, AggregateShardReports({}));
  EXPECT_TRUE(values.empty());
}

}  // namespace
}  // namespace metric
}  // namespace shard_metrics
