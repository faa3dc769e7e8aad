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
#include <vector>

#include "common/libs/utils/result.h"
#include "host/libs/image/disk_image_tool.h"
#include "host/libs/image/volume_manager.h"

namespace osinstall {

inline constexpr char kAutomatedInstallTarget[] = "/Volumes/Macintosh HD";

// Writes the configuration that makes the installer run without user
// interaction into `packages_dir`/Extras.
Result<void> WriteAutomatedInstallConfig(const std::string& packages_dir);

/*
 * Produces `destination`, a compressed copy of `source_image` whose Packages
 * directory also holds `packages` and an OSInstall.collection listing them.
 *
 * The source image is mounted through a shadow file and never modified. The
 * mount is always released before this returns, including on failure.
 */
Result<void> Inject(VolumeManager& volume_manager,
                    DiskImageTool& disk_image_tool,
                    const std::string& source_image,
                    const std::vector<std::string>& packages,
                    const std::string& destination,
                    bool write_automated_config);

}  // namespace osinstall
