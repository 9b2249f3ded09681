/*
 * Copyright (C) 2018 The Android Open Source Project
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
#pragma once

#include <sys/types.h>

#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace ukify {

// Keeps track of a running (sub)process. Allows to wait for its completion.
// It's an error to wait twice for the same subprocess.
class Subprocess {
 public:
  explicit Subprocess(pid_t pid) : pid_(pid), started_(pid > 0) {}
  // The default implementation won't do because we need to reset the pid of
  // the moved object.
  Subprocess(Subprocess&&);
  ~Subprocess() = default;
  Subprocess& operator=(Subprocess&&);
  // Waits for the subprocess to complete. Returns the exit code, or a negative
  // value if waiting failed or the process was killed by a signal.
  int Wait();
  // Same as waitpid(2)
  pid_t Wait(int* wstatus, int options);
  // Whether fork() succeeded. It says nothing about exec or successful
  // completion of the command, that's what Wait is for.
  bool Started() const { return started_; }
  pid_t pid() const { return pid_; }

 private:
  // Copy is disabled to avoid waiting twice for the same pid (the first wait
  // frees the pid, which allows the kernel to reuse it so we may end up waiting
  // for the wrong process)
  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;
  pid_t pid_ = -1;
  bool started_ = false;
};

// An executable command. The executable is looked up in PATH when it does not
// contain a slash. Multiple subprocesses can be started from the same object.
class Command {
 public:
  explicit Command(std::string executable) {
    command_.push_back(std::move(executable));
  }
  Command(Command&&) = default;
  Command& operator=(Command&&) = default;
  Command(const Command&) = delete;
  Command& operator=(const Command&) = delete;

  // Adds a single parameter to the command. All arguments are concatenated
  // into a single string to form a parameter.
  template <typename... Args>
  Command& AddParameter(Args&&... args) {
    std::stringstream ss;
    (ss << ... << std::forward<Args>(args));
    command_.push_back(ss.str());
    return *this;
  }

  // Starts execution of the command with the given descriptors as its
  // standard streams. A negative descriptor keeps the parent's stream.
  Subprocess Start(int stdout_fd = -1, int stderr_fd = -1) const;

  const std::string& GetShortName() const {
    // This is safe because the constructor guarantees the name of the binary
    // to be at index 0 on the vector
    return command_[0];
  }
  const std::vector<std::string>& Arguments() const { return command_; }
  std::string AsBashScript() const;

 private:
  std::vector<std::string> command_;
};

/*
 * Consumes a Command and runs it, optionally capturing the output channels.
 *
 * If `stdout_str` is set, the subprocess stdout will be captured and saved to
 * it. If `stderr_str` is set, the subprocess stderr will be captured and saved
 * to it.
 *
 * If `command` exits normally, the lower 8 bits of the return code will be
 * returned in a value between 0 and 255.
 * If some setup fails, `command` fails to start, or `command` exits due to a
 * signal, the return value will be negative.
 */
int RunWithManagedStdio(Command&& command, std::string* stdout_str,
                        std::string* stderr_str);

}  // namespace ukify
