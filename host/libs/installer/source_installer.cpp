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

#include "host/libs/installer/source_installer.h"

#include <string>

#include <android-base/logging.h>
#include <android-base/strings.h>

#include "common/libs/utils/files.h"

namespace osinstall {
namespace {

constexpr char kSharedSupport[] = "/Contents/SharedSupport";
constexpr char kInstallImage[] = "InstallESD.dmg";
constexpr char kManifest[] = "OSInstall.mpkg";
constexpr char kInstallInfo[] = "InstallInfo.plist";
constexpr char kImageManifest[] = "/Packages/OSInstall.mpkg";

std::string StripTrailingSlashes(std::string path) {
  while (path.size() > 1 && path.back() == '/') {
    path.pop_back();
  }
  return path;
}

}  // namespace

std::string SourceInstaller::ManifestPath(
    const std::string& install_image_root) const {
  if (manifest) {
    return *manifest;
  }
  return install_image_root + kImageManifest;
}

Result<SourceInstaller> ResolveSourceInstaller(const std::string& path) {
  OI_EXPECT(!path.empty(), "No installer source given");
  const auto source = StripTrailingSlashes(AbsolutePath(path));
  OI_EXPECTF(FileExists(source), "\"{}\" does not exist", source);

  SourceInstaller installer;
  installer.path = source;
  if (android::base::EndsWith(source, ".app")) {
    OI_EXPECTF(DirectoryExists(source), "\"{}\" is not an application bundle",
               source);
    const auto shared_support = source + kSharedSupport;
    installer.kind = SourceKind::kAppBundle;
    installer.install_image = shared_support + "/" + kInstallImage;
    installer.manifest = shared_support + "/" + kManifest;
    OI_EXPECTF(FileExists(installer.install_image),
               "\"{}\" is missing from the installer application",
               installer.install_image);
    OI_EXPECTF(FileExists(*installer.manifest),
               "\"{}\" is missing from the installer application",
               *installer.manifest);
    const auto install_info = shared_support + "/" + kInstallInfo;
    if (FileExists(install_info)) {
      installer.installer_options = install_info;
    }
  } else {
    OI_EXPECTF(!DirectoryExists(source),
               "\"{}\" is neither an installer application nor a disk image",
               source);
    installer.kind = SourceKind::kDiskImage;
    installer.install_image = source;
  }
  LOG(DEBUG) << "Install image: " << installer.install_image;
  return installer;
}

}  // namespace osinstall
