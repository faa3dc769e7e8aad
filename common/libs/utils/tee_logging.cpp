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

#include "common/libs/utils/tee_logging.h"

#include <fcntl.h>
#include <inttypes.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <time.h>
#include <unistd.h>

#include <memory>
#include <string>
#include <vector>

#include <android-base/file.h>
#include <android-base/macros.h>
#include <android-base/stringprintf.h>
#include <android-base/strings.h>
#include <android-base/threads.h>

using android::base::GetThreadId;
using android::base::LogSeverity;
using android::base::StringPrintf;

namespace osinstall {
namespace {

LogSeverity GuessSeverity(const std::string& env_var,
                          LogSeverity default_value) {
  char* env_cstr = getenv(env_var.c_str());
  std::string env_value(env_cstr == nullptr ? "" : env_cstr);
  auto severity = ToSeverity(env_value);
  return severity.ok() ? *severity : default_value;
}

// Copied from system/libbase/logging_splitters.h
// This adds the log header to each line of message and returns it as a string
// intended to be written to stderr.
std::string StderrOutputGenerator(const struct tm& now, int pid, uint64_t tid,
                                  LogSeverity severity, const char* tag,
                                  const char* file, unsigned int line,
                                  const char* message) {
  char timestamp[32];
  strftime(timestamp, sizeof(timestamp), "%m-%d %H:%M:%S", &now);

  static const char log_characters[] = "VDIWEFF";
  static_assert(arraysize(log_characters) - 1 == android::base::FATAL + 1,
                "Mismatch in size of log_characters and values in LogSeverity");
  char severity_char = log_characters[severity];
  std::string line_prefix;
  if (file != nullptr) {
    line_prefix = StringPrintf("%s %c %s %5d %5" PRIu64 " %s:%u] ",
                               tag ? tag : "nullptr", severity_char, timestamp,
                               pid, tid, file, line);
  } else {
    line_prefix = StringPrintf("%s %c %s %5d %5" PRIu64 " ",
                               tag ? tag : "nullptr", severity_char, timestamp,
                               pid, tid);
  }

  std::string output_string;
  for (const auto& message_line : android::base::Split(message, "\n")) {
    output_string.append(line_prefix);
    output_string.append(message_line);
    output_string.append("\n");
  }
  return output_string;
}

std::string OnlyMessage(const char* message) {
  std::string output_string(message);
  output_string.append("\n");
  return output_string;
}

}  // namespace

std::string FromSeverity(const LogSeverity severity) {
  switch (severity) {
    case android::base::VERBOSE:
      return "VERBOSE";
    case android::base::DEBUG:
      return "DEBUG";
    case android::base::INFO:
      return "INFO";
    case android::base::WARNING:
      return "WARNING";
    case android::base::ERROR:
      return "ERROR";
    case android::base::FATAL_WITHOUT_ABORT:
      return "FATAL_WITHOUT_ABORT";
    case android::base::FATAL:
      return "FATAL";
  }
  return "Unexpected severity";
}

Result<LogSeverity> ToSeverity(const std::string& value) {
  const std::vector<LogSeverity> severities = {
      android::base::VERBOSE, android::base::DEBUG,
      android::base::INFO,    android::base::WARNING,
      android::base::ERROR,   android::base::FATAL_WITHOUT_ABORT,
      android::base::FATAL,
  };
  for (const auto severity : severities) {
    if (android::base::EqualsIgnoreCase(value, FromSeverity(severity)) ||
        value == std::to_string(static_cast<int>(severity))) {
      return severity;
    }
  }
  return OI_ERR("Unable to convert \"" << value << "\" to a LogSeverity");
}

LogSeverity ConsoleSeverity() {
  return GuessSeverity("OI_CONSOLE_SEVERITY", android::base::INFO);
}

LogSeverity LogFileSeverity() {
  return GuessSeverity("OI_FILE_SEVERITY", android::base::DEBUG);
}

TeeLogger::TeeLogger(const std::vector<SeverityTarget>& destinations)
    : destinations_(destinations) {}

void TeeLogger::operator()(android::base::LogId, LogSeverity severity,
                           const char* tag, const char* file,
                           unsigned int line, const char* message) {
  struct tm now;
  time_t t = time(nullptr);
  localtime_r(&t, &now);
  std::string full_string;
  for (const auto& destination : destinations_) {
    if (severity < destination.severity) {
      continue;
    }
    if (destination.metadata_level == MetadataLevel::ONLY_MESSAGE) {
      android::base::WriteStringToFd(OnlyMessage(message),
                                     destination.target->get());
      continue;
    }
    if (full_string.empty()) {
      full_string = StderrOutputGenerator(now, getpid(), GetThreadId(),
                                          severity, tag, file, line, message);
    }
    android::base::WriteStringToFd(full_string, destination.target->get());
  }
}

Result<TeeLogger> LogToStderrAndFiles(const std::vector<std::string>& files) {
  std::vector<SeverityTarget> log_severities;
  for (const auto& file : files) {
    auto log_file_fd = std::make_shared<android::base::unique_fd>(
        open(file.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC,
             S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP));
    if (log_file_fd->get() < 0) {
      return OI_ERRNO("Failed to create log file \"" << file
                                                     << "\": " << strerror(errno));
    }
    log_severities.push_back(
        SeverityTarget{LogFileSeverity(), log_file_fd, MetadataLevel::FULL});
  }
  auto stderr_fd = std::make_shared<android::base::unique_fd>(
      fcntl(STDERR_FILENO, F_DUPFD_CLOEXEC, 3));
  if (stderr_fd->get() < 0) {
    return OI_ERRNO("Failed to duplicate stderr: " << strerror(errno));
  }
  log_severities.push_back(SeverityTarget{ConsoleSeverity(), stderr_fd,
                                          MetadataLevel::ONLY_MESSAGE});
  return TeeLogger(log_severities);
}

}  // namespace osinstall
