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

// Evaluates classification predictions stored in a csv file.
//
// Usage example:
//   ./evaluate_predictions \
//     --alsologtostderr \
//     --predictions=/path/to/predictions.csv \
//     --options='classes:"yes" classes:"no" area_under_curve:true' \
//     --batch_size=64 \
//     --num_shards=4
//
#include <iostream>
#include <string>

#include "absl/flags/flag.h"
#include "shard_metrics/cli/evaluation.h"
#include "shard_metrics/metric/classification.h"
#include "shard_metrics/metric/metric.pb.h"
#include "shard_metrics/utils/logging.h"
#include "shard_metrics/utils/protobuf.h"

ABSL_FLAG(std::string, predictions, "",
          "Path to a csv file with a \"label\" column and one probability "
          "column per class.");

ABSL_FLAG(std::string, options, "",
          "Evaluation options. proto::ClassificationEvaluationOptions text "
          "proto.");

ABSL_FLAG(int, batch_size, 32, "Number of examples in each evaluation step.");

ABSL_FLAG(int, num_shards, 1,
          "Number of shards evaluated independently and then aggregated.");

ABSL_FLAG(bool, print_report, false,
          "Print the merged metric accumulators as a text proto.");

constexpr char kUsageMessage[] =
    "Evaluates classification predictions stored in a csv file.";

namespace shard_metrics {
namespace cli {

void EvaluatePredictions() {
  // Check required flags.
  QCHECK(!absl::GetFlag(FLAGS_predictions).empty());

  const auto options =
      utils::ParseTextProto<metric::proto::ClassificationEvaluationOptions>(
          absl::GetFlag(FLAGS_options))
          .value();
  const auto evaluator =
      metric::ClassificationEvaluator::Create(options).value();

  const auto content = GetContent(absl::GetFlag(FLAGS_predictions)).value();
  const auto steps = ParsePredictionSteps(content, evaluator.class_list(),
                                          absl::GetFlag(FLAGS_batch_size))
                         .value();

  const auto evaluation =
      EvaluateSharded(evaluator, steps, absl::GetFlag(FLAGS_num_shards))
          .value();

  std::cout << "Evaluation:" << std::endl;
  for (const auto& name_and_value : evaluation.values) {
    std::cout << name_and_value.first << ": " << name_and_value.second
              << std::endl;
  }

  if (absl::GetFlag(FLAGS_print_report)) {
    std::cout << "Report:" << std::endl
              << utils::SerializeTextProto(evaluation.merged_report).value();
  }
}

}  // namespace cli
}  // namespace shard_metrics

int main(int argc, char** argv) {
  InitLogging(kUsageMessage, &argc, &argv);
  shard_metrics::cli::EvaluatePredictions();
  return 0;
}
