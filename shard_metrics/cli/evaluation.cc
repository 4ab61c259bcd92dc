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

#include "shard_metrics/cli/evaluation.h"

#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "absl/strings/substitute.h"
#include "shard_metrics/metric/report.h"
#include "shard_metrics/metric/serialization.h"
#include "shard_metrics/utils/logging.h"
#include "shard_metrics/utils/protobuf.h"
#include "shard_metrics/utils/status_macros.h"

namespace shard_metrics {
namespace cli {

namespace {

constexpr char kLabelColumn[] = "label";

}  // namespace

absl::StatusOr<std::string> GetContent(const absl::string_view path) {
  std::ifstream file(std::string(path), std::ios::binary);
  if (!file.is_open()) {
    return absl::NotFoundError(absl::StrCat("Cannot open file ", path));
  }
  std::stringstream content;
  content << file.rdbuf();
  if (file.bad()) {
    return absl::DataLossError(absl::StrCat("Cannot read file ", path));
  }
  return content.str();
}

absl::StatusOr<std::vector<metric::ClassificationEvaluator::Step>>
ParsePredictionSteps(const absl::string_view csv_content,
                     const std::vector<std::string>& class_list,
                     const int batch_size) {
  STATUS_CHECK_GT(batch_size, 0);

  std::vector<absl::string_view> lines;
  for (absl::string_view line :
       absl::StrSplit(csv_content, '\n', absl::SkipWhitespace())) {
    lines.push_back(absl::StripSuffix(line, "\r"));
  }
  if (lines.empty()) {
    return absl::InvalidArgumentError("The prediction file has no header");
  }

  // Index of the columns.
  const std::vector<std::string> header = absl::StrSplit(lines.front(), ',');
  int label_column = -1;
  absl::flat_hash_map<std::string, int> column_per_class;
  for (int column_idx = 0; column_idx < header.size(); column_idx++) {
    if (header[column_idx] == kLabelColumn) {
      label_column = column_idx;
    } else {
      column_per_class[header[column_idx]] = column_idx;
    }
  }
  if (label_column < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("No \"", kLabelColumn, "\" column in the header"));
  }
  std::vector<int> class_columns;
  class_columns.reserve(class_list.size());
  for (const auto& class_label : class_list) {
    const auto it = column_per_class.find(class_label);
    if (it == column_per_class.end()) {
      return absl::InvalidArgumentError(absl::StrCat(
          "No probability column for the class \"", class_label, "\""));
    }
    class_columns.push_back(it->second);
  }

  std::vector<metric::ClassificationEvaluator::Step> steps;
  for (int line_idx = 1; line_idx < lines.size(); line_idx++) {
    const std::vector<absl::string_view> fields =
        absl::StrSplit(lines[line_idx], ',');
    if (fields.size() != header.size()) {
      return absl::InvalidArgumentError(absl::Substitute(
          "Line $0 has $1 fields while the header has $2 fields", line_idx + 1,
          fields.size(), header.size()));
    }
    if ((line_idx - 1) % batch_size == 0) {
      steps.emplace_back();
    }
    auto& step = steps.back();
    step.labels.emplace_back(fields[label_column]);
    std::vector<double> probabilities;
    probabilities.reserve(class_columns.size());
    for (const int column : class_columns) {
      double probability;
      if (!absl::SimpleAtod(fields[column], &probability)) {
        return absl::InvalidArgumentError(
            absl::Substitute("Cannot parse \"$0\" as a probability on line $1",
                             fields[column], line_idx + 1));
      }
      probabilities.push_back(probability);
    }
    step.probabilities.push_back(std::move(probabilities));
  }
  return steps;
}

absl::StatusOr<ShardedEvaluation> EvaluateSharded(
    const metric::ClassificationEvaluator& evaluator,
    const std::vector<metric::ClassificationEvaluator::Step>& steps,
    const int num_shards) {
  STATUS_CHECK_GT(num_shards, 0);

  std::vector<metric::MetricsReport> shard_reports(num_shards);
  for (int step_idx = 0; step_idx < steps.size(); step_idx++) {
    auto& shard_report = shard_reports[step_idx % num_shards];
    RETURN_IF_ERROR(
        evaluator.EvaluateStep(steps[step_idx], &shard_report).status());
  }

  // Ships the shard reports as serialized protos.
  std::vector<metric::MetricsReport> received_reports;
  received_reports.reserve(num_shards);
  for (const auto& shard_report : shard_reports) {
    const std::string serialized =
        metric::ReportToProto(shard_report).SerializeAsString();
    ASSIGN_OR_RETURN(
        const auto report_proto,
        utils::ParseBinaryProto<metric::proto::MetricsReport>(serialized));
    ASSIGN_OR_RETURN(auto report, metric::ReportFromProto(report_proto));
    received_reports.push_back(std::move(report));
  }
  LOG(INFO) << "Evaluated " << steps.size() << " steps on " << num_shards
            << " shard(s)";

  ShardedEvaluation evaluation;
  ASSIGN_OR_RETURN(evaluation.values,
                   metric::AggregateShardReports(received_reports));

  metric::MetricsReport merged;
  for (const auto& report : received_reports) {
    RETURN_IF_ERROR(merged.MergeFrom(report));
  }
  evaluation.merged_report = metric::ReportToProto(merged);
  return evaluation;
}

}  // namespace cli
}  // namespace shard_metrics
