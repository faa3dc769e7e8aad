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
#pragma once

#include <sys/stat.h>
#include <sys/types.h>

#include <string>
#include <vector>

#include "common/libs/utils/result.h"

namespace osinstall {

bool FileExists(const std::string& path, bool follow_symlinks = true);
bool FileHasContent(const std::string& path);
bool DirectoryExists(const std::string& path, bool follow_symlinks = true);
off_t FileSize(const std::string& path);
bool RemoveFile(const std::string& file);

Result<std::vector<std::string>> DirectoryContents(const std::string& path);

Result<void> EnsureDirectoryExists(const std::string& directory_path,
                                   mode_t mode = S_IRWXU | S_IRWXG | S_IROTH |
                                                 S_IXOTH);

// Removes `path` and everything below it. Does not cross mount points, so a
// volume still attached somewhere under `path` is left alone.
Result<void> RecursivelyRemoveDirectory(const std::string& path);

// Copies a regular file, preserving its permission bits. `to` is replaced if
// it exists.
Result<void> Copy(const std::string& from, const std::string& to);

// Copies the directory `from` to the not yet existing directory `to`,
// recreating symlinks instead of following them.
Result<void> CopyDirectoryRecursively(const std::string& from,
                                      const std::string& to);

Result<void> MakeFileExecutable(const std::string& path);

// The returned value may contain .. or . if these are present in the path
// argument.
// path must not contain ~
std::string AbsolutePath(const std::string& path);

std::string CurrentDirectory();

std::string cpp_basename(const std::string& str);
std::string cpp_dirname(const std::string& str);

}  // namespace osinstall
