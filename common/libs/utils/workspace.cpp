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

#include "common/libs/utils/workspace.h"

#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>

#include <string>
#include <utility>
#include <vector>

#include <android-base/logging.h>

#include "common/libs/utils/files.h"

namespace osinstall {

Result<Workspace> Workspace::Create(const std::string& parent,
                                    const std::string& prefix) {
  OI_EXPECT(EnsureDirectoryExists(parent));
  std::string templ = parent + "/" + prefix + "XXXXXX";
  std::vector<char> buffer(templ.begin(), templ.end());
  buffer.push_back('\0');
  if (mkdtemp(buffer.data()) == nullptr) {
    return OI_ERRNO("mkdtemp(\"" << templ << "\") failed: " << strerror(errno));
  }
  std::string path(buffer.data());
  LOG(DEBUG) << "Created workspace " << path;
  return Workspace(std::move(path));
}

Workspace::Workspace(std::string path) : path_(std::move(path)) {}

Workspace::Workspace(Workspace&& other) noexcept
    : path_(std::move(other.path_)) {
  other.path_.clear();
}

Workspace& Workspace::operator=(Workspace&& other) noexcept {
  if (this != &other) {
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

Workspace::~Workspace() {
  if (path_.empty()) {
    return;
  }
  auto removed = RecursivelyRemoveDirectory(path_);
  if (!removed.ok()) {
    LOG(ERROR) << "Failed to remove workspace \"" << path_
               << "\": " << removed.error().Message();
  } else {
    LOG(DEBUG) << "Removed workspace " << path_;
  }
}

std::string Workspace::PathFor(const std::string& name) const {
  return path_ + "/" + name;
}

Result<std::string> Workspace::MountRoot() const {
  auto mounts = PathFor("mounts");
  OI_EXPECT(EnsureDirectoryExists(mounts));
  return mounts;
}

Result<std::string> Workspace::ShadowDirectory() const {
  auto shadows = PathFor("shadows");
  OI_EXPECT(EnsureDirectoryExists(shadows));
  return shadows;
}

Result<std::string> Workspace::CreateDirectory(const std::string& name) const {
  auto directory = PathFor(name);
  OI_EXPECTF(!FileExists(directory, /* follow_symlinks */ false),
             "\"{}\" already exists in the workspace", name);
  if (mkdir(directory.c_str(), S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH |
                                   S_IXOTH) != 0) {
    return OI_ERRNO("mkdir(\"" << directory << "\") failed: "
                               << strerror(errno));
  }
  return directory;
}

}  // namespace osinstall
