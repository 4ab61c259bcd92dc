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

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/types/variant.h"
#include "shard_metrics/metric/metric.pb.h"
#include "shard_metrics/utils/test.h"

namespace shard_metrics {
namespace metric {
namespace {

using test::EqualsProto;
using test::StatusIs;
using testing::ElementsAre;

TEST(Serialization, ConfusionMatrix) {
  const proto::NamedMetric expected = PARSE_TEST_PROTO(R"pb(
    name: "class_a_recall"
    recall {
      true_positives: 3
      true_negatives: 4
      false_positives: 1
      false_negatives: 2
    }
  )pb");
  const auto named_metric =
      MetricToProto("class_a_recall", RecallMetric(3, 4, 1, 2));
  EXPECT_THAT(named_metric, EqualsProto(expected));

  ASSERT_OK_AND_ASSIGN(const auto metric, MetricFromProto(named_metric));
  ASSERT_TRUE(absl::holds_alternative<RecallMetric>(metric));
  EXPECT_EQ(absl::get<RecallMetric>(metric).counts(),
            (ConfusionCounts{3, 4, 1, 2}));
}

TEST(Serialization, WeightedF1) {
  const WeightedF1Metric metric({{"a", ClassificationF1Metric(1, 2, 0, 1)},
                                 {"b", ClassificationF1Metric(2, 1, 1, 0)}});
  const auto metric_proto = WeightedF1ToProto(metric);
  EXPECT_EQ(metric_proto.f1_per_class_size(), 2);
  EXPECT_EQ(metric_proto.f1_per_class().at("b").true_positives(), 2);

  ASSERT_OK_AND_ASSIGN(const auto restored, WeightedF1FromProto(metric_proto));
  EXPECT_EQ(restored.f1_per_class().at("a").counts(),
            metric.f1_per_class().at("a").counts());
  EXPECT_NEAR(restored.Value(), metric.Value(), 1e-9);
}

TEST(Serialization, Auc) {
  ASSERT_OK_AND_ASSIGN(
      const auto metric,
      AUCMetrics::FromRawData({"pos", "neg", "pos"}, {0.2, 0.5, 0.8}, "pos",
                              /*decimal_places=*/1));
  const proto::AucCurve expected = PARSE_TEST_PROTO(R"pb(
    class_label: "pos"
    thresholds: [ 0.2, 0.5, 0.8, 1.5 ]
    false_positives: [ 1, 1, 0, 0 ]
    true_positives: [ 2, 1, 1, 0 ]
    positive_count: 2
    negative_count: 1
  )pb");
  const auto metric_proto = AucToProto(metric);
  EXPECT_THAT(metric_proto, EqualsProto(expected));

  ASSERT_OK_AND_ASSIGN(const auto restored, AucFromProto(metric_proto));
  EXPECT_EQ(restored.thresholds(), metric.thresholds());
  EXPECT_EQ(restored.buckets(), metric.buckets());
  EXPECT_NEAR(restored.Value(), 0.5, 1e-9);
}

TEST(Serialization, Report) {
  MetricsReport report;
  ASSERT_OK(report.Record("loss", AverageMetric(3, 2)));
  ASSERT_OK(report.Record("class_a_prec", PrecisionMetric(1, 0, 1, 0)));
  const auto report_proto = ReportToProto(report);
  ASSERT_EQ(report_proto.metrics_size(), 2);

  ASSERT_OK_AND_ASSIGN(const auto restored, ReportFromProto(report_proto));
  EXPECT_THAT(restored.Names(), ElementsAre("class_a_prec", "loss"));
  ASSERT_OK_AND_ASSIGN(const double loss, restored.Value("loss"));
  EXPECT_NEAR(loss, 1.5, 1e-9);
}

TEST(Serialization, ReportMergesDuplicatedNames) {
  const proto::MetricsReport report_proto = PARSE_TEST_PROTO(R"pb(
    metrics {
      name: "loss"
      average { sum: 1 count: 1 }
    }
    metrics {
      name: "loss"
      average { sum: 5 count: 3 }
    }
  )pb");
  ASSERT_OK_AND_ASSIGN(const auto report, ReportFromProto(report_proto));
  ASSERT_OK_AND_ASSIGN(const double loss, report.Value("loss"));
  EXPECT_NEAR(loss, 1.5, 1e-9);
}

TEST(Serialization, InvalidConfusionMatrix) {
  const proto::NamedMetric named_metric = PARSE_TEST_PROTO(R"pb(
    name: "f1"
    f1 { true_positives: -1 }
  )pb");
  EXPECT_THAT(MetricFromProto(named_metric).status(),
              StatusIs(absl::StatusCode::kInvalidArgument, "Negative"));
}

TEST(Serialization, InvalidWeightedF1) {
  const proto::WeightedF1 without_examples = PARSE_TEST_PROTO(R"pb(
    f1_per_class {
      key: "a"
      value {}
    }
  )pb");
  EXPECT_THAT(WeightedF1FromProto(without_examples).status(),
              StatusIs(absl::StatusCode::kInvalidArgument, "no examples"));

  const proto::WeightedF1 empty_second_class = PARSE_TEST_PROTO(R"pb(
    f1_per_class {
      key: "a"
      value { true_positives: 1 true_negatives: 1 }
    }
    f1_per_class {
      key: "b"
      value {}
    }
  )pb");
  EXPECT_THAT(WeightedF1FromProto(empty_second_class).status(),
              StatusIs(absl::StatusCode::kInvalidArgument, "\"b\""));

  // The invalid metric is rejected before reaching the aggregation.
  const proto::MetricsReport report_proto = PARSE_TEST_PROTO(R"pb(
    metrics {
      name: "weighted_f1"
      weighted_f1 {
        f1_per_class {
          key: "a"
          value {}
        }
      }
    }
  )pb");
  EXPECT_THAT(ReportFromProto(report_proto).status(),
              StatusIs(absl::StatusCode::kInvalidArgument));

  const proto::WeightedF1 empty;
  ASSERT_OK_AND_ASSIGN(const auto restored, WeightedF1FromProto(empty));
  EXPECT_TRUE(restored.f1_per_class().empty());
}

TEST(Serialization, InvalidAuc) {
  const proto::AucCurve inconsistent_sizes = PARSE_TEST_PROTO(R"pb(
    class_label: "pos"
    thresholds: [ 0.1, 1.5 ]
    false_positives: [ 1 ]
    true_positives: [ 1, 0 ]
    positive_count: 1
    negative_count: 1
  )pb");
  EXPECT_THAT(AucFromProto(inconsistent_sizes).status(),
              StatusIs(absl::StatusCode::kInvalidArgument, "Inconsistent"));

  const proto::AucCurve unsorted = PARSE_TEST_PROTO(R"pb(
    class_label: "pos"
    thresholds: [ 1.5, 0.1 ]
    false_positives: [ 0, 1 ]
    true_positives: [ 0, 1 ]
    positive_count: 1
    negative_count: 1
  )pb");
  EXPECT_THAT(AucFromProto(unsorted).status(),
              StatusIs(absl::StatusCode::kInvalidArgument));

  const proto::AucCurve not_cumulative = PARSE_TEST_PROTO(R"pb(
    class_label: "pos"
    thresholds: [ 0.1, 1.5 ]
    false_positives: [ 0, 0 ]
    true_positives: [ 1, 0 ]
    positive_count: 1
    negative_count: 1
  )pb");
  EXPECT_THAT(AucFromProto(not_cumulative).status(),
              StatusIs(absl::StatusCode::kInvalidArgument, "lowest threshold"));
}

TEST(Serialization, InvalidAverage) {
  proto::Average average;
  average.set_count(-2);
  EXPECT_THAT(AverageFromProto(average).status(),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(Serialization, MetricWithoutValue) {
  proto::NamedMetric named_metric;
  named_metric.set_name("m");
  EXPECT_THAT(MetricFromProto(named_metric).status(),
              StatusIs(absl::StatusCode::kInvalidArgument, "has no value"));
}

TEST(Serialization, MetricWithoutName) {
  const proto::MetricsReport report_proto = PARSE_TEST_PROTO(R"pb(
    metrics { average { sum: 1 count: 1 } }
  )pb");
  EXPECT_THAT(ReportFromProto(report_proto).status(),
              StatusIs(absl::StatusCode::kInvalidArgument, "without a name"));
}

TEST(Serialization, TypeMismatchInReport) {
  const proto::MetricsReport report_proto = PARSE_TEST_PROTO(R"pb(
    metrics {
      name: "m"
      average { sum: 1 count: 1 }
    }
    metrics {
      name: "m"
      precision { true_positives: 1 }
    }
  )pb");
  EXPECT_THAT(ReportFromProto(report_proto).status(),
              StatusIs(absl::StatusCode::kInvalidArgument, "Cannot merge"));
}

}  // namespace
}  // namespace metric
}  // namespace shard_metrics
