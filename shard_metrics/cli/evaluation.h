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

// Building blocks of the "evaluate_predictions" tool.

#ifndef SHARD_METRICS_CLI_EVALUATION_H_
#define SHARD_METRICS_CLI_EVALUATION_H_

#include <map>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "shard_metrics/metric/classification.h"
#include "shard_metrics/metric/metric.pb.h"

namespace shard_metrics {
namespace cli {

// Reads the content of a file.
absl::StatusOr<std::string> GetContent(absl::string_view path);

// Parses a csv file of predictions into evaluation steps of "batch_size"
// examples. The first row is the header "label,<class 1>,<class 2>,...", and
// the following rows contain the true label and the probability of each class.
// The class columns can be in any order, but all the classes of "class_list"
// should be present. The probabilities of the steps follow the order of
// "class_list".
absl::StatusOr<std::vector<metric::ClassificationEvaluator::Step>>
ParsePredictionSteps(absl::string_view csv_content,
                     const std::vector<std::string>& class_list,
                     int batch_size);

// Result of a sharded evaluation.
struct ShardedEvaluation {
  // Final value of each metric.
  std::map<std::string, double> values;
  // All the shard reports merged together.
  metric::proto::MetricsReport merged_report;
};

// Evaluates the steps on "num_shards" shards (the steps are assigned round
// robin). Each shard report is serialized, as if it was sent by a worker, and
// the shards are aggregated with "AggregateShardReports".
absl::StatusOr<ShardedEvaluation> EvaluateSharded(
    const metric::ClassificationEvaluator& evaluator,
    const std::vector<metric::ClassificationEvaluator::Step>& steps,
    int num_shards);

}  // namespace cli
}  // namespace shard_metrics

#endif  // SHARD_METRICS_CLI_EVALUATION_H_
