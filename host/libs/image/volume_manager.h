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

#include <stddef.h>

#include <optional>
#include <string>
#include <vector>

#include "common/libs/utils/result.h"
#include "common/libs/utils/workspace.h"
#include "host/libs/image/disk_image_tool.h"

namespace osinstall {

// Leading message of the error returned when an image attaches without
// exposing any volume.
inline constexpr char kNothingMountedMessage[] = "Nothing mounted from";

bool IsNothingMounted(const StackTraceError& error);

struct MountHandle {
  std::string image;
  std::vector<std::string> mount_points;
  std::optional<std::string> shadow_path;
};

class ScopedMount;

// Attaches disk images below the workspace and tracks how many are attached.
class VolumeManager {
 public:
  VolumeManager(DiskImageTool& disk_image_tool, const Workspace& workspace);
  VolumeManager(const VolumeManager&) = delete;
  VolumeManager& operator=(const VolumeManager&) = delete;
  ~VolumeManager();

  // With `use_shadow`, writes to the mounted volumes are redirected to a new
  // shadow file in the workspace, leaving `image` untouched.
  Result<MountHandle> Mount(const std::string& image, bool use_shadow);
  Result<ScopedMount> MountScoped(const std::string& image, bool use_shadow);

  // Detaches every mount point of `handle`, forcing the detach when the
  // first attempt fails. Failures are logged, never returned.
  void Unmount(const MountHandle& handle);

  size_t LiveMounts() const { return live_mounts_; }

 private:
  Result<std::string> NewShadowPath(const std::string& image);

  DiskImageTool& disk_image_tool_;
  const Workspace& workspace_;
  size_t live_mounts_ = 0;
  size_t shadow_count_ = 0;
};

// Unmounts its handle when it goes out of scope, unless Unmount() was already
// called.
class ScopedMount {
 public:
  ScopedMount(VolumeManager& manager, MountHandle handle);
  ScopedMount(ScopedMount&& other) noexcept;
  ScopedMount& operator=(ScopedMount&&) = delete;
  ScopedMount(const ScopedMount&) = delete;
  ScopedMount& operator=(const ScopedMount&) = delete;
  ~ScopedMount();

  const MountHandle& handle() const { return handle_; }
  // The first volume of the image.
  const std::string& root() const { return handle_.mount_points.front(); }
  bool mounted() const { return manager_ != nullptr; }

  void Unmount();

 private:
  VolumeManager* manager_;
  MountHandle handle_;
};

}  // namespace osinstall
