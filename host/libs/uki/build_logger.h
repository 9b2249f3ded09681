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

#pragma once

#include <sstream>
#include <string>

#include <android-base/logging.h>

namespace ukify {

/**
 * A logger owned by a single build. It filters on its own minimum severity
 * and forwards accepted lines to an android-base log sink, so that a build
 * never has to touch the process-wide severity set by InitLogging.
 */
class BuildLogger {
 public:
  class Line {
   public:
    Line(const BuildLogger& logger, android::base::LogSeverity severity,
         const char* file, unsigned int line);
    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;
    ~Line();

    std::ostream& stream() { return stream_; }

   private:
    const BuildLogger* logger_;
    android::base::LogSeverity severity_;
    const char* file_;
    unsigned int line_;
    std::ostringstream stream_;
  };

  explicit BuildLogger(
      android::base::LogSeverity min_severity = android::base::INFO,
      android::base::LogFunction sink = android::base::StderrLogger);

  bool ShouldLog(android::base::LogSeverity severity) const {
    return severity >= min_severity_;
  }
  android::base::LogSeverity MinSeverity() const { return min_severity_; }

  Line Log(android::base::LogSeverity severity, const char* file,
           unsigned int line) const {
    return Line(*this, severity, file, line);
  }

 private:
  void Write(android::base::LogSeverity severity, const char* file,
             unsigned int line, const std::string& message) const;

  android::base::LogSeverity min_severity_;
  android::base::LogFunction sink_;
};

// Maps "debug", "info", "warn" and "error" (any case) to a severity. Anything
// else is INFO.
android::base::LogSeverity ParseLogSeverity(const std::string& level);

}  // namespace ukify

#define BUILD_LOG(logger, severity) \
  (logger).Log(::android::base::severity, __FILE__, __LINE__).stream()
