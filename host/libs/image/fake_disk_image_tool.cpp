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

#include "host/libs/image/fake_disk_image_tool.h"

#include <stdio.h>

#include <string>
#include <utility>
#include <vector>

#include <android-base/file.h>
#include <android-base/logging.h>

#include "common/libs/utils/files.h"

namespace osinstall {

void FakeDiskImageTool::AddImage(const std::string& image,
                                 std::vector<std::string> volumes) {
  images_[image] = std::move(volumes);
}

const std::vector<std::string>* FakeDiskImageTool::FindVolumes(
    const std::string& image) const {
  auto it = images_.find(image);
  if (it == images_.end()) {
    it = images_.find(cpp_basename(image));
  }
  return it == images_.end() ? nullptr : &it->second;
}

Result<std::vector<std::string>> FakeDiskImageTool::Attach(
    const std::string& image, const std::string& mount_root,
    const std::optional<std::string>& shadow) {
  OI_EXPECTF(failing_attach_.count(image) == 0, "hdiutil: attach failed - {}",
             image);
  OI_EXPECTF(FileExists(image), "hdiutil: attach failed - no such file {}",
             image);
  std::vector<std::string> mount_points;
  const auto* volumes = FindVolumes(image);
  if (volumes == nullptr) {
    return mount_points;
  }
  if (shadow) {
    OI_EXPECT(android::base::WriteStringToFile("", *shadow));
    ++shadowed_attach_count_;
  }
  for (const auto& volume : *volumes) {
    auto mount_point =
        mount_root + "/fake." + std::to_string(++attach_count_);
    OI_EXPECT(CopyDirectoryRecursively(volume, mount_point));
    attached_[mount_point] = Attachment{image, shadow};
    mount_points.push_back(mount_point);
  }
  attached_images_.push_back(image);
  return mount_points;
}

Result<void> FakeDiskImageTool::Detach(const std::string& mount_point,
                                       bool force) {
  auto it = attached_.find(mount_point);
  OI_EXPECTF(it != attached_.end(), "hdiutil: detach failed - {} not attached",
             mount_point);
  if (force) {
    ++forced_detach_count_;
  } else if (failing_polite_detaches_ > 0) {
    --failing_polite_detaches_;
    return OI_ERR("hdiutil: couldn't unmount - Resource busy");
  }
  const auto shadow = it->second.shadow;
  attached_.erase(it);
  if (shadow && !FileExists(*shadow + ".tree")) {
    if (rename(mount_point.c_str(), (*shadow + ".tree").c_str()) != 0) {
      return OI_ERRNO("rename(\"" << mount_point << "\") failed");
    }
    return {};
  }
  OI_EXPECT(RecursivelyRemoveDirectory(mount_point));
  return {};
}

Result<void> FakeDiskImageTool::ConvertCompressed(
    const std::string& image, const std::string& shadow,
    const std::string& destination) {
  OI_EXPECT(!fail_convert_, "hdiutil: convert failed - Input/output error");
  OI_EXPECTF(FileExists(image), "hdiutil: convert failed - no such file {}",
             image);
  OI_EXPECTF(!FileExists(destination),
             "hdiutil: convert failed - {} already exists", destination);
  const auto tree = shadow + ".tree";
  OI_EXPECTF(DirectoryExists(tree), "no shadow content for {}", shadow);
  OI_EXPECT(android::base::WriteStringToFile("UDZO\n", destination));
  converted_[destination] = tree;
  images_[destination] = {tree};
  return {};
}

Result<uint64_t> FakeDiskImageTool::AvailableBytes(
    const std::string& mount_point) {
  OI_EXPECTF(attached_.count(mount_point) != 0, "{} is not attached",
             mount_point);
  OI_EXPECT(available_bytes_.has_value(), "statvfs failed");
  return *available_bytes_;
}

std::string FakeDiskImageTool::ConvertedTree(
    const std::string& destination) const {
  auto it = converted_.find(destination);
  return it == converted_.end() ? "" : it->second;
}

}  // namespace osinstall
