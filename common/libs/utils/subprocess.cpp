/*
 * Copyright (C) 2024 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "common/libs/utils/subprocess.h"

#include <errno.h>
#include <fcntl.h>
#include <stdlib.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <map>
#include <string>
#include <thread>
#include <vector>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/strings.h>
#include <android-base/unique_fd.h>

namespace osinstall {
namespace {

std::vector<const char*> ToCharPointers(const std::vector<std::string>& vect) {
  std::vector<const char*> ret = {};
  for (const auto& str : vect) {
    ret.push_back(str.c_str());
  }
  ret.push_back(NULL);
  return ret;
}

// Joins the owned threads on every exit path, as running the destructor of
// an active std::thread crashes the program.
class ThreadJoiner {
 public:
  explicit ThreadJoiner(std::vector<std::thread*> threads)
      : threads_(std::move(threads)) {}
  ~ThreadJoiner() {
    for (auto& thread : threads_) {
      if (thread->joinable()) {
        thread->join();
      }
    }
  }

 private:
  std::vector<std::thread*> threads_;
};

}  // namespace

Subprocess::Subprocess(Subprocess&& subprocess)
    : pid_(subprocess.pid_), started_(subprocess.started_) {
  // Make sure the moved object no longer controls this subprocess
  subprocess.pid_ = -1;
  subprocess.started_ = false;
}

Subprocess& Subprocess::operator=(Subprocess&& other) {
  pid_ = other.pid_;
  started_ = other.started_;

  other.pid_ = -1;
  other.started_ = false;
  return *this;
}

int Subprocess::Wait() {
  if (pid_ < 0) {
    LOG(ERROR)
        << "Attempt to wait on invalid pid(has it been waited on already?): "
        << pid_;
    return -1;
  }
  int wstatus = 0;
  auto pid = pid_;  // Wait will set pid_ to -1 after waiting
  auto wait_ret = Wait(&wstatus, 0);
  if (wait_ret < 0) {
    PLOG(ERROR) << "Error on call to waitpid";
    return wait_ret;
  }
  int retval = 0;
  if (WIFEXITED(wstatus)) {
    retval = WEXITSTATUS(wstatus);
    if (retval) {
      LOG(DEBUG) << "Subprocess " << pid
                 << " exited with error code: " << retval;
    }
  } else if (WIFSIGNALED(wstatus)) {
    LOG(ERROR) << "Subprocess " << pid
               << " was interrupted by a signal: " << WTERMSIG(wstatus);
    retval = -1;
  }
  return retval;
}

pid_t Subprocess::Wait(int* wstatus, int options) {
  if (pid_ < 0) {
    LOG(ERROR)
        << "Attempt to wait on invalid pid(has it been waited on already?): "
        << pid_;
    return -1;
  }
  auto retval = TEMP_FAILURE_RETRY(waitpid(pid_, wstatus, options));
  // We don't want to wait twice for the same process
  pid_ = -1;
  return retval;
}

Result<void> Command::RedirectStdIO(Subprocess::StdIOChannel channel,
                                    int fd) {
  OI_EXPECTF(fd >= 0, "Invalid file descriptor to redirect \"{}\" to",
             GetShortName());
  OI_EXPECTF(redirects_.count(channel) == 0,
             "Channel {} of \"{}\" was already redirected",
             static_cast<int>(channel), GetShortName());
  redirects_[channel] = fd;
  return {};
}

Subprocess Command::Start(SubprocessOptions options) const {
  auto cmd = ToCharPointers(command_);
  pid_t pid = fork();
  if (!pid) {
    for (const auto& redirect : redirects_) {
      if (dup2(redirect.second, static_cast<int>(redirect.first)) < 0) {
        _exit(EXIT_FAILURE);
      }
    }
    if (working_directory_ && chdir(working_directory_->c_str()) != 0) {
      _exit(EXIT_FAILURE);
    }
    execv(cmd[0], const_cast<char* const*>(cmd.data()));
    // No need for an if: if exec worked it wouldn't have returned.
    // Avoid the logging machinery here, the child shares its state with the
    // parent.
    _exit(127);
  }
  if (pid == -1) {
    PLOG(ERROR) << "fork failed";
  } else if (options.Verbose()) {
    LOG(DEBUG) << "Started (pid: " << pid << "): " << ToString();
  }
  return Subprocess(pid);
}

std::string Command::ToString() const {
  std::vector<std::string> quoted;
  for (const auto& argument : command_) {
    if (argument.find_first_of(" \t'\"") == std::string::npos) {
      quoted.push_back(argument);
    } else {
      quoted.push_back("'" + argument + "'");
    }
  }
  return android::base::Join(quoted, " ");
}

int RunWithManagedStdio(Command&& cmd_tmp, const std::string* stdin,
                        std::string* stdout, std::string* stderr,
                        SubprocessOptions options) {
  /*
   * The order of these declarations is necessary for safety. If the function
   * returns at any point, the pipe ends held by this function are closed
   * first, which makes the reader and writer threads finish. The
   * ThreadJoiner then waits for the threads to complete.
   *
   * C++ scoping rules dictate that objects are descoped in reverse order to
   * construction, so this behavior is predictable.
   */
  std::thread stdin_thread, stdout_thread, stderr_thread;
  ThreadJoiner thread_joiner({&stdin_thread, &stdout_thread, &stderr_thread});
  Command cmd = std::move(cmd_tmp);
  android::base::unique_fd stdin_read, stdin_write;
  android::base::unique_fd stdout_read, stdout_write;
  android::base::unique_fd stderr_read, stderr_write;
  bool io_error = false;

  if (stdin != nullptr) {
    if (!android::base::Pipe(&stdin_read, &stdin_write)) {
      PLOG(ERROR) << "Could not create a pipe to write the stdin of \""
                  << cmd.GetShortName() << "\"";
      return -1;
    }
    if (!cmd.RedirectStdIO(Subprocess::StdIOChannel::kStdIn, stdin_read.get())
             .ok()) {
      return -1;
    }
  }
  if (stdout != nullptr) {
    if (!android::base::Pipe(&stdout_read, &stdout_write)) {
      PLOG(ERROR) << "Could not create a pipe to read the stdout of \""
                  << cmd.GetShortName() << "\"";
      return -1;
    }
    if (!cmd.RedirectStdIO(Subprocess::StdIOChannel::kStdOut,
                           stdout_write.get())
             .ok()) {
      return -1;
    }
  }
  if (stderr != nullptr) {
    if (!android::base::Pipe(&stderr_read, &stderr_write)) {
      PLOG(ERROR) << "Could not create a pipe to read the stderr of \""
                  << cmd.GetShortName() << "\"";
      return -1;
    }
    if (!cmd.RedirectStdIO(Subprocess::StdIOChannel::kStdErr,
                           stderr_write.get())
             .ok()) {
      return -1;
    }
  }

  auto subprocess = cmd.Start(options);
  // The child holds its own copies now; closing ours lets the readers see EOF.
  stdin_read.reset();
  stdout_write.reset();
  stderr_write.reset();
  if (!subprocess.Started()) {
    return -1;
  }

  if (stdin != nullptr) {
    stdin_thread = std::thread([&stdin_write, stdin, &io_error]() {
      if (!android::base::WriteStringToFd(*stdin, stdin_write.get())) {
        io_error = true;
        PLOG(ERROR) << "Error in writing stdin to process";
      }
      stdin_write.reset();
    });
  }
  if (stdout != nullptr) {
    stdout_thread = std::thread([&stdout_read, stdout, &io_error]() {
      if (!android::base::ReadFdToString(stdout_read.get(), stdout)) {
        io_error = true;
        PLOG(ERROR) << "Error in reading stdout from process";
      }
    });
  }
  if (stderr != nullptr) {
    stderr_thread = std::thread([&stderr_read, stderr, &io_error]() {
      if (!android::base::ReadFdToString(stderr_read.get(), stderr)) {
        io_error = true;
        PLOG(ERROR) << "Error in reading stderr from process";
      }
    });
  }

  int exit_code = subprocess.Wait();
  if (stdin_thread.joinable()) {
    stdin_thread.join();
  }
  if (stdout_thread.joinable()) {
    stdout_thread.join();
  }
  if (stderr_thread.joinable()) {
    stderr_thread.join();
  }
  if (io_error) {
    LOG(ERROR) << "IO error communicating with " << cmd.GetShortName();
    return -1;
  }
  return exit_code;
}

Result<std::string> RunAndCaptureStdout(Command&& command) {
  auto description = command.ToString();
  std::string stdout_str;
  std::string stderr_str;
  int exit_code = RunWithManagedStdio(std::move(command), nullptr, &stdout_str,
                                      &stderr_str);
  OI_EXPECTF(exit_code == 0, "`{}` failed with exit code {}: {}", description,
             exit_code, android::base::Trim(stderr_str));
  return stdout_str;
}

Result<void> Execute(Command&& command) {
  OI_EXPECT(RunAndCaptureStdout(std::move(command)));
  return {};
}

}  // namespace osinstall
