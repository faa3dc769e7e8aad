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
#include "common/libs/utils/workspace.h"
#include "host/libs/image/volume_manager.h"
#include "host/libs/installer/package_tool.h"

namespace osinstall {

inline constexpr char kDefaultInstallerTitle[] = "Install OS X";

struct VersionInfo {
  std::string product_version;
  std::string build_number;
};

// Pieces of the vendor installer manifest carried over to the synthesized
// one, each the markup of a single element. Absent pieces are empty.
struct ManifestFragments {
  std::string title = kDefaultInstallerTitle;
  std::string install_script;
  std::string installation_check;
  std::string volume_check;
};

struct InstallerOptions {
  std::optional<std::string> os_version;
  std::optional<std::string> os_build_version;
};

struct ExpandedManifest {
  std::string distribution;
  std::string resources;
};

// `path` is either the root of a mounted system volume or its
// SystemVersion.plist.
Result<VersionInfo> ExtractVersionInfo(const std::string& path);

// Mounts the BaseSystem.dmg found at the root of the mounted install image
// and reads the version from it.
Result<VersionInfo> ReadInstallImageVersion(
    VolumeManager& volume_manager, const std::string& install_image_root);

// Never fails: a missing or malformed manifest yields the defaults.
ManifestFragments ExtractManifestFragments(const std::string& distribution);

// Never fails: unreadable options leave the fields unset.
InstallerOptions ExtractInstallerOptions(const std::string& path);

// Flat packages are expanded into the workspace, directory packages are used
// where they are.
Result<ExpandedManifest> ExpandManifest(PackageTool& package_tool,
                                        const Workspace& workspace,
                                        const std::string& manifest);

}  // namespace osinstall
