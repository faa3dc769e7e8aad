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

#include <optional>
#include <string>
#include <vector>

#include <fruit/fruit.h>

#include "common/libs/utils/result.h"

namespace osinstall {

// Low level operations on UDIF disk images. The system implementation shells
// out to hdiutil; tests substitute a fake.
class DiskImageTool {
 public:
  virtual ~DiskImageTool() = default;

  // Attaches `image` below `mount_root` and returns the mount points of the
  // volumes it contains, possibly none. Writes go to `shadow` when set.
  virtual Result<std::vector<std::string>> Attach(
      const std::string& image, const std::string& mount_root,
      const std::optional<std::string>& shadow) = 0;
  virtual Result<void> Detach(const std::string& mount_point, bool force) = 0;
  // Writes a compressed (UDZO) copy of `image` with the changes recorded in
  // `shadow` applied to `destination`.
  virtual Result<void> ConvertCompressed(const std::string& image,
                                         const std::string& shadow,
                                         const std::string& destination) = 0;
  // Space available to an unprivileged writer on the mounted volume.
  virtual Result<uint64_t> AvailableBytes(const std::string& mount_point) = 0;
};

// Extracts every system-entities[].mount-point from the property list printed
// by `hdiutil attach -plist`. Text before the XML declaration is ignored.
Result<std::vector<std::string>> ParseAttachOutput(const std::string& output);

fruit::Component<DiskImageTool> HdiutilDiskImageToolComponent();

}  // namespace osinstall
