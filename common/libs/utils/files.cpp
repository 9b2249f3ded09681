/*
 * Copyright (C) 2017 The Android Open Source Project
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

#include "common/libs/utils/files.h"

#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include <android-base/file.h>
#include <android-base/unique_fd.h>

#include "common/libs/utils/result.h"

namespace ukify {

bool FileExists(const std::string& path, bool follow_symlinks) {
  struct stat st {};
  return (follow_symlinks ? stat : lstat)(path.c_str(), &st) == 0;
}

bool FileHasContent(const std::string& path) {
  return FileSize(path) > 0;
}

Result<std::vector<std::string>> DirectoryContents(const std::string& path) {
  std::vector<std::string> ret;
  std::unique_ptr<DIR, int(*)(DIR*)> dir(opendir(path.c_str()), closedir);
  UKIFY_EXPECTF(dir != nullptr, "Could not read from dir \"{}\"", path);
  struct dirent* ent{};
  while ((ent = readdir(dir.get()))) {
    std::string name = ent->d_name;
    if (name == "." || name == "..") {
      continue;
    }
    ret.emplace_back(std::move(name));
  }
  return ret;
}

bool DirectoryExists(const std::string& path, bool follow_symlinks) {
  struct stat st {};
  if ((follow_symlinks ? stat : lstat)(path.c_str(), &st) == -1) {
    return false;
  }
  if ((st.st_mode & S_IFMT) != S_IFDIR) {
    return false;
  }
  return true;
}

off_t FileSize(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) == -1) {
    return 0;
  }
  return st.st_size;
}

bool RemoveFile(const std::string& file) {
  return remove(file.c_str()) == 0;
}

Result<std::string> ReadFileContents(const std::string& path) {
  std::string contents;
  UKIFY_EXPECTF(android::base::ReadFileToString(path, &contents),
                "Failed to read \"{}\": {}", path, strerror(errno));
  return contents;
}

Result<void> WriteNewFile(const std::string& path, const std::string& contents,
                          mode_t mode) {
  android::base::unique_fd fd(TEMP_FAILURE_RETRY(
      open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode)));
  UKIFY_EXPECTF(fd.ok(), "Failed to open \"{}\" for writing: {}", path,
                strerror(errno));
  UKIFY_EXPECTF(android::base::WriteStringToFd(contents, fd.get()),
                "Failed to write {} bytes to \"{}\": {}", contents.size(),
                path, strerror(errno));
  return {};
}

Result<std::string> CreateTempDirectory(const std::string& parent,
                                        const std::string& prefix) {
  std::string templ = parent + "/" + prefix + ".XXXXXX";
  std::vector<char> buffer(templ.begin(), templ.end());
  buffer.push_back('\0');
  UKIFY_EXPECTF(mkdtemp(buffer.data()) != nullptr,
                "mkdtemp(\"{}\") failed: {}", templ, strerror(errno));
  return std::string(buffer.data());
}

namespace {

// nftw takes a plain function pointer, the first failure is kept here.
thread_local int remove_failure_errno = 0;

int RemoveEntry(const char* child, const struct stat*, int file_type,
                struct FTW*) {
  int ret = 0;
  switch (file_type) {
    case FTW_D:
    case FTW_DP:
    case FTW_DNR:
      ret = rmdir(child);
      break;
    default:
      ret = unlink(child);
      break;
  }
  if (ret == -1 && remove_failure_errno == 0) {
    remove_failure_errno = errno;
  }
  return 0;
}

}  // namespace

Result<void> RecursivelyRemoveDirectory(const std::string& path) {
  if (!FileExists(path, /* follow_symlinks */ false)) {
    return {};
  }
  remove_failure_errno = 0;
  int walk = nftw(path.c_str(), RemoveEntry, 128,
                  FTW_DEPTH | FTW_MOUNT | FTW_PHYS);
  int walk_errno = walk == -1 ? errno : remove_failure_errno;
  UKIFY_EXPECTF(!FileExists(path, /* follow_symlinks */ false),
                "Failed to remove \"{}\": {}", path, strerror(walk_errno));
  return {};
}

std::string StringFromEnv(const std::string& varname,
                          const std::string& defval) {
  const char* const valstr = getenv(varname.c_str());
  if (!valstr) {
    return defval;
  }
  return valstr;
}

std::string TempDirectoryRoot() {
  auto tmpdir = StringFromEnv("TMPDIR", "");
  if (tmpdir.empty()) {
    return "/tmp";
  }
  return tmpdir;
}

}  // namespace ukify
