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

#include <memory>
#include <string>
#include <vector>

#include <android-base/logging.h>
#include <android-base/unique_fd.h>

#include "common/libs/utils/result.h"

namespace osinstall {

std::string FromSeverity(android::base::LogSeverity severity);
Result<android::base::LogSeverity> ToSeverity(const std::string& value);

// Read from OI_CONSOLE_SEVERITY and OI_FILE_SEVERITY.
android::base::LogSeverity ConsoleSeverity();
android::base::LogSeverity LogFileSeverity();

enum class MetadataLevel {
  FULL,
  ONLY_MESSAGE,
};

struct SeverityTarget {
  android::base::LogSeverity severity;
  std::shared_ptr<android::base::unique_fd> target;
  MetadataLevel metadata_level;
};

class TeeLogger {
 public:
  TeeLogger(const std::vector<SeverityTarget>& destinations);
  ~TeeLogger() = default;

  void operator()(android::base::LogId log_id,
                  android::base::LogSeverity severity, const char* tag,
                  const char* file, unsigned int line, const char* message);

 private:
  std::vector<SeverityTarget> destinations_;
};

// Messages go to stderr at ConsoleSeverity() and, with full metadata, to
// every file in `files` at LogFileSeverity().
Result<TeeLogger> LogToStderrAndFiles(const std::vector<std::string>& files);

}  // namespace osinstall
