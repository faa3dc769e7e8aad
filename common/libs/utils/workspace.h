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

#include <string>

#include "common/libs/utils/result.h"

namespace osinstall {

// A scratch directory owned by a single build. Created with mkdtemp and
// removed, with everything below it, when the workspace is destroyed. Volumes
// attached under the workspace must be detached before that happens.
class Workspace {
 public:
  static Result<Workspace> Create(const std::string& parent,
                                  const std::string& prefix);

  Workspace(Workspace&&) noexcept;
  Workspace& operator=(Workspace&&) noexcept;
  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;
  ~Workspace();

  const std::string& path() const { return path_; }
  std::string PathFor(const std::string& name) const;

  // Parent directory for randomly named mount points.
  Result<std::string> MountRoot() const;
  Result<std::string> ShadowDirectory() const;
  // A fresh, empty directory below the workspace.
  Result<std::string> CreateDirectory(const std::string& name) const;

 private:
  explicit Workspace(std::string path);

  std::string path_;
};

}  // namespace osinstall
