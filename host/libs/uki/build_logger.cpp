//
// Copyright (C) 2024 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "host/libs/uki/build_logger.h"

#include <string>
#include <utility>

#include <android-base/logging.h>
#include <android-base/strings.h>

namespace ukify {

static constexpr char kLogTag[] = "ukify";

BuildLogger::Line::Line(const BuildLogger& logger,
                        android::base::LogSeverity severity, const char* file,
                        unsigned int line)
    : logger_(&logger), severity_(severity), file_(file), line_(line) {}

BuildLogger::Line::~Line() {
  if (logger_->ShouldLog(severity_)) {
    logger_->Write(severity_, file_, line_, stream_.str());
  }
}

BuildLogger::BuildLogger(android::base::LogSeverity min_severity,
                         android::base::LogFunction sink)
    : min_severity_(min_severity), sink_(std::move(sink)) {}

void BuildLogger::Write(android::base::LogSeverity severity, const char* file,
                        unsigned int line, const std::string& message) const {
  if (!sink_) {
    return;
  }
  sink_(android::base::DEFAULT, severity, kLogTag, file, line,
        message.c_str());
}

android::base::LogSeverity ParseLogSeverity(const std::string& level) {
  using android::base::EqualsIgnoreCase;
  if (EqualsIgnoreCase(level, "debug")) {
    return android::base::DEBUG;
  } else if (EqualsIgnoreCase(level, "warn") ||
             EqualsIgnoreCase(level, "warning")) {
    return android::base::WARNING;
  } else if (EqualsIgnoreCase(level, "error")) {
    return android::base::ERROR;
  }
  return android::base::INFO;
}

}  // namespace ukify
