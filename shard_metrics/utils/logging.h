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

// Logging options.

#ifndef SHARD_METRICS_UTILS_LOGGING_H_
#define SHARD_METRICS_UTILS_LOGGING_H_

// IWYU pragma: begin_exports
#include "absl/log/check.h"
#include "absl/log/log.h"
// IWYU pragma: end_exports

// Initializes the logging and parses the command line flags. Should be called
// when a program starts.
void InitLogging(const char* usage, int* argc, char*** argv);

#endif  // SHARD_METRICS_UTILS_LOGGING_H_
