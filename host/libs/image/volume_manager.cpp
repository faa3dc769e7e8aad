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

#include "host/libs/image/volume_manager.h"

#include <string>
#include <utility>

#include <android-base/logging.h>
#include <android-base/strings.h>

#include "common/libs/utils/files.h"

namespace osinstall {

bool IsNothingMounted(const StackTraceError& error) {
  return android::base::StartsWith(error.Message(), kNothingMountedMessage);
}

VolumeManager::VolumeManager(DiskImageTool& disk_image_tool,
                             const Workspace& workspace)
    : disk_image_tool_(disk_image_tool), workspace_(workspace) {}

VolumeManager::~VolumeManager() {
  if (live_mounts_ != 0) {
    LOG(ERROR) << live_mounts_ << " disk image(s) still mounted";
  }
}

Result<std::string> VolumeManager::NewShadowPath(const std::string& image) {
  auto directory = OI_EXPECT(workspace_.ShadowDirectory());
  auto base = directory + "/" + cpp_basename(image);
  auto path = base + ".shadow";
  // The same image may be mounted more than once per build.
  while (FileExists(path, /* follow_symlinks */ false)) {
    path = base + "." + std::to_string(++shadow_count_) + ".shadow";
  }
  return path;
}

Result<MountHandle> VolumeManager::Mount(const std::string& image,
                                         bool use_shadow) {
  OI_EXPECTF(FileExists(image), "Disk image \"{}\" does not exist", image);
  MountHandle handle;
  handle.image = image;
  if (use_shadow) {
    handle.shadow_path = OI_EXPECT(NewShadowPath(image));
  }
  auto mount_root = OI_EXPECT(workspace_.MountRoot());
  LOG(INFO) << "Mounting " << image
            << (use_shadow ? " with a shadow file" : "");
  handle.mount_points = OI_EXPECTF(
      disk_image_tool_.Attach(image, mount_root, handle.shadow_path),
      "Failed to mount \"{}\"", image);
  if (handle.mount_points.empty()) {
    return OI_ERR(kNothingMountedMessage << " \"" << image << "\"");
  }
  ++live_mounts_;
  for (const auto& mount_point : handle.mount_points) {
    LOG(DEBUG) << image << " mounted at " << mount_point;
  }
  return handle;
}

Result<ScopedMount> VolumeManager::MountScoped(const std::string& image,
                                               bool use_shadow) {
  auto handle = OI_EXPECT(Mount(image, use_shadow));
  return ScopedMount(*this, std::move(handle));
}

void VolumeManager::Unmount(const MountHandle& handle) {
  for (const auto& mount_point : handle.mount_points) {
    // Detaching one volume ejects its siblings on the same device.
    if (!DirectoryExists(mount_point)) {
      LOG(DEBUG) << mount_point << " is already detached";
      continue;
    }
    auto detached = disk_image_tool_.Detach(mount_point, /* force */ false);
    if (detached.ok()) {
      LOG(DEBUG) << "Detached " << mount_point;
      continue;
    }
    LOG(WARNING) << "Could not detach " << mount_point
                 << ", forcing: " << detached.error().Message();
    detached = disk_image_tool_.Detach(mount_point, /* force */ true);
    if (!detached.ok()) {
      LOG(ERROR) << "Failed to detach " << mount_point << ": "
                 << detached.error().Message();
    }
  }
  if (live_mounts_ == 0) {
    LOG(ERROR) << "Unmounting " << handle.image << " which was not mounted";
    return;
  }
  --live_mounts_;
}

ScopedMount::ScopedMount(VolumeManager& manager, MountHandle handle)
    : manager_(&manager), handle_(std::move(handle)) {}

ScopedMount::ScopedMount(ScopedMount&& other) noexcept
    : manager_(other.manager_), handle_(std::move(other.handle_)) {
  other.manager_ = nullptr;
}

ScopedMount::~ScopedMount() { Unmount(); }

void ScopedMount::Unmount() {
  if (manager_ == nullptr) {
    return;
  }
  manager_->Unmount(handle_);
  manager_ = nullptr;
}

}  // namespace osinstall
