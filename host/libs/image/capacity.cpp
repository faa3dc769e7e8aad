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

#include "host/libs/image/capacity.h"

#include <sys/stat.h>

#include <string>
#include <vector>

#include <android-base/logging.h>

#include "common/libs/utils/files.h"

namespace osinstall {
namespace {

uint64_t SizeOfTreeBytes(const std::string& path) {
  struct stat st {};
  if (lstat(path.c_str(), &st) != 0) {
    PLOG(WARNING) << "Could not stat \"" << path << "\"";
    return 0;
  }
  if (S_ISREG(st.st_mode)) {
    return static_cast<uint64_t>(st.st_size);
  }
  if (!S_ISDIR(st.st_mode)) {
    return 0;
  }
  auto contents = DirectoryContents(path);
  if (!contents.ok()) {
    LOG(WARNING) << contents.error().Message();
    return 0;
  }
  uint64_t total = 0;
  for (const auto& name : *contents) {
    total += SizeOfTreeBytes(path + "/" + name);
  }
  return total;
}

}  // namespace

int64_t SizeOfPathsKB(const std::vector<std::string>& paths) {
  uint64_t total_bytes = 0;
  for (const auto& path : paths) {
    if (!FileExists(path, /* follow_symlinks */ false)) {
      LOG(WARNING) << "\"" << path << "\" does not exist, counting it as empty";
      continue;
    }
    total_bytes += SizeOfTreeBytes(path);
  }
  return static_cast<int64_t>((total_bytes + 1023) / 1024);
}

Result<void> CheckCapacity(const CapacityReport& report, int64_t margin_kb) {
  OI_EXPECT(report.available_space_kb >= 0,
            "Could not determine the free space on the install image");
  OI_EXPECTF(
      report.total_package_size_kb + margin_kb <= report.available_space_kb,
      "Not enough space on the install image: packages need {} KB plus a {} "
      "KB margin, only {} KB available",
      report.total_package_size_kb, margin_kb, report.available_space_kb);
  return {};
}

CapacityPlanner::CapacityPlanner(VolumeManager& volume_manager,
                                 DiskImageTool& disk_image_tool)
    : volume_manager_(volume_manager), disk_image_tool_(disk_image_tool) {}

int64_t CapacityPlanner::AvailableSpaceKB(const std::string& image) {
  auto mount = volume_manager_.MountScoped(image, /* use_shadow */ false);
  if (!mount.ok()) {
    LOG(ERROR) << "Could not mount " << image
               << " to measure free space: " << mount.error().Message();
    return -1;
  }
  auto available = disk_image_tool_.AvailableBytes(mount->root());
  if (!available.ok()) {
    LOG(ERROR) << "Could not measure free space on " << mount->root() << ": "
               << available.error().Message();
    return -1;
  }
  return static_cast<int64_t>(*available / 1024);
}

Result<CapacityReport> CapacityPlanner::PlanCapacity(
    const std::string& image, const std::vector<std::string>& packages) {
  CapacityReport report;
  report.total_package_size_kb = SizeOfPathsKB(packages);
  report.available_space_kb = AvailableSpaceKB(image);
  LOG(INFO) << "Packages need " << report.total_package_size_kb << " KB, "
            << report.available_space_kb << " KB available on " << image;
  OI_EXPECT(CheckCapacity(report));
  return report;
}

}  // namespace osinstall
