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

#include "common/libs/utils/subprocess.h"

#include <fcntl.h>
#include <stdlib.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <android-base/file.h>
#include <android-base/unique_fd.h>

namespace ukify {
namespace {

std::vector<const char*> ToCharPointers(const std::vector<std::string>& vect) {
  std::vector<const char*> ret = {};
  for (const auto& str : vect) {
    ret.push_back(str.c_str());
  }
  ret.push_back(NULL);
  return ret;
}

// A class that waits for threads to exit in its destructor.
class ThreadJoiner {
  std::vector<std::thread*> threads_;

 public:
  ThreadJoiner(const std::vector<std::thread*> threads) : threads_(threads) {}
  ~ThreadJoiner() {
    for (auto& thread : threads_) {
      if (thread->joinable()) {
        thread->join();
      }
    }
  }
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
    return -1;
  }
  int wstatus = 0;
  if (Wait(&wstatus, 0) < 0) {
    return -1;
  }
  if (WIFEXITED(wstatus)) {
    return WEXITSTATUS(wstatus);
  }
  return -1;
}

pid_t Subprocess::Wait(int* wstatus, int options) {
  if (pid_ < 0) {
    return -1;
  }
  auto retval = TEMP_FAILURE_RETRY(waitpid(pid_, wstatus, options));
  // We don't want to wait twice for the same process
  pid_ = -1;
  return retval;
}

Subprocess Command::Start(int stdout_fd, int stderr_fd) const {
  auto cmd = ToCharPointers(command_);
  pid_t pid = fork();
  if (pid == 0) {
    if (stdout_fd >= 0 && dup2(stdout_fd, STDOUT_FILENO) < 0) {
      _exit(127);
    }
    if (stderr_fd >= 0 && dup2(stderr_fd, STDERR_FILENO) < 0) {
      _exit(127);
    }
    execvp(cmd[0], const_cast<char* const*>(cmd.data()));
    // No need for an if: if exec worked it wouldn't have returned
    _exit(127);
  }
  return Subprocess(pid);
}

std::string Command::AsBashScript() const {
  std::stringstream script;
  for (size_t i = 0; i < command_.size(); i++) {
    if (i > 0) {
      script << " ";
    }
    script << "'" << command_[i] << "'";
  }
  return script.str();
}

int RunWithManagedStdio(Command&& cmd_tmp, std::string* stdout_str,
                        std::string* stderr_str) {
  /*
   * The order of these declarations is necessary for safety. Objects are
   * destroyed in reverse order, so on every return path the ThreadJoiner waits
   * for the readers before the pipes and the flag they use go away.
   */
  Command cmd = std::move(cmd_tmp);
  android::base::unique_fd stdout_read, stdout_write;
  android::base::unique_fd stderr_read, stderr_write;
  std::atomic<bool> io_error{false};
  std::thread stdout_thread, stderr_thread;
  ThreadJoiner thread_joiner({&stdout_thread, &stderr_thread});
  if (stdout_str != nullptr &&
      !android::base::Pipe(&stdout_read, &stdout_write)) {
    return -1;
  }
  if (stderr_str != nullptr &&
      !android::base::Pipe(&stderr_read, &stderr_write)) {
    return -1;
  }

  auto subprocess = cmd.Start(stdout_write.get(), stderr_write.get());
  // The child holds its own copies, the readers only see EOF once these are
  // gone.
  stdout_write.reset();
  stderr_write.reset();
  if (!subprocess.Started()) {
    return -1;
  }

  if (stdout_str != nullptr) {
    stdout_thread = std::thread([&stdout_read, stdout_str, &io_error]() {
      if (!android::base::ReadFdToString(stdout_read.get(), stdout_str)) {
        io_error = true;
      }
    });
  }
  if (stderr_str != nullptr) {
    stderr_thread = std::thread([&stderr_read, stderr_str, &io_error]() {
      if (!android::base::ReadFdToString(stderr_read.get(), stderr_str)) {
        io_error = true;
      }
    });
  }

  int wstatus = 0;
  if (subprocess.Wait(&wstatus, 0) < 0) {
    return -1;
  }
  {
    auto join_threads = std::move(thread_joiner);
  }
  if (WIFSIGNALED(wstatus)) {
    return -1;
  }
  if (io_error) {
    return -1;
  }
  return WEXITSTATUS(wstatus);
}

}  // namespace ukify
