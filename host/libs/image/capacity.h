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

#include <stdint.h>

#include <string>
#include <vector>

#include "common/libs/utils/result.h"
#include "host/libs/image/disk_image_tool.h"
#include "host/libs/image/volume_manager.h"

namespace osinstall {

// Free space required on the install image beyond the packages themselves.
inline constexpr int64_t kCapacityMarginKB = 100;

struct CapacityReport {
  int64_t total_package_size_kb;
  // Negative when the free space could not be determined.
  int64_t available_space_kb;
};

// Apparent size of files and directory trees, rounded up to whole kilobytes.
// Paths that do not exist count as empty.
int64_t SizeOfPathsKB(const std::vector<std::string>& paths);

Result<void> CheckCapacity(const CapacityReport& report,
                           int64_t margin_kb = kCapacityMarginKB);

class CapacityPlanner {
 public:
  CapacityPlanner(VolumeManager& volume_manager,
                  DiskImageTool& disk_image_tool);

  // Mounts `image` read-only for the duration of the query. Returns -1 if
  // the image cannot be mounted or queried.
  int64_t AvailableSpaceKB(const std::string& image);

  // Fails unless `packages` fit on `image` with the safety margin to spare.
  Result<CapacityReport> PlanCapacity(const std::string& image,
                                      const std::vector<std::string>& packages);

 private:
  VolumeManager& volume_manager_;
  DiskImageTool& disk_image_tool_;
};

}  // namespace osinstall
