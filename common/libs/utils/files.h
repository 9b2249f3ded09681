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
#pragma once

#include <sys/stat.h>
#include <sys/types.h>

#include <string>
#include <vector>

#include "common/libs/utils/result.h"

namespace ukify {

bool FileExists(const std::string& path, bool follow_symlinks = true);
bool FileHasContent(const std::string& path);
bool DirectoryExists(const std::string& path, bool follow_symlinks = true);
Result<std::vector<std::string>> DirectoryContents(const std::string& path);
off_t FileSize(const std::string& path);
bool RemoveFile(const std::string& file);

// Reads the whole file. Fails if the file cannot be opened or read, unlike an
// empty read which succeeds with an empty string.
Result<std::string> ReadFileContents(const std::string& path);

// Creates or truncates `path` and writes `contents` to it.
Result<void> WriteNewFile(const std::string& path, const std::string& contents,
                          mode_t mode = S_IRUSR | S_IWUSR);

// Creates a uniquely named directory "<parent>/<prefix>.XXXXXX" with mode
// 0700 and returns its path.
Result<std::string> CreateTempDirectory(const std::string& parent,
                                        const std::string& prefix);

// Removes `path` and everything under it without following symlinks.
// A missing `path` is not an error.
Result<void> RecursivelyRemoveDirectory(const std::string& path);

// $TMPDIR if set and non-empty, otherwise /tmp.
std::string TempDirectoryRoot();

std::string StringFromEnv(const std::string& varname,
                          const std::string& defval);

}  // namespace ukify
