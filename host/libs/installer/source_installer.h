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

#include <optional>
#include <string>

#include "common/libs/utils/result.h"

namespace osinstall {

enum class SourceKind {
  kAppBundle,
  kDiskImage,
};

// The vendor installer a build starts from. An application bundle carries the
// install image and the installer manifest next to each other, a bare install
// image carries the manifest inside.
struct SourceInstaller {
  SourceKind kind;
  std::string path;
  std::string install_image;
  // Only set for application bundles.
  std::optional<std::string> manifest;
  std::optional<std::string> installer_options;

  // Location of the installer manifest once the install image is mounted at
  // `install_image_root`.
  std::string ManifestPath(const std::string& install_image_root) const;
};

Result<SourceInstaller> ResolveSourceInstaller(const std::string& path);

}  // namespace osinstall
