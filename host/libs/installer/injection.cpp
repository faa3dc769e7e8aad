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

#include "host/libs/installer/injection.h"

#include <string>
#include <vector>

#include <android-base/logging.h>
#include <json/json.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/plist.h"
#include "host/libs/installer/package_list.h"

namespace osinstall {
namespace {

Result<void> CopyPackage(const std::string& package,
                         const std::string& packages_dir) {
  const auto destination = packages_dir + "/" + cpp_basename(package);
  OI_EXPECTF(!FileExists(destination, /* follow_symlinks */ false),
             "\"{}\" already holds {}", packages_dir, cpp_basename(package));
  LOG(INFO) << "Adding " << cpp_basename(package) << " to the install image";
  if (DirectoryExists(package)) {
    OI_EXPECT(CopyDirectoryRecursively(package, destination));
  } else {
    OI_EXPECT(Copy(package, destination));
  }
  return {};
}

Result<void> InjectIntoImage(VolumeManager& volume_manager,
                             DiskImageTool& disk_image_tool,
                             const std::string& source_image,
                             const std::vector<std::string>& packages,
                             const std::string& destination,
                             bool write_automated_config) {
  const auto list = BuildPackageManifestList(packages);

  auto mount =
      OI_EXPECT(volume_manager.MountScoped(source_image, /* use_shadow */ true));
  const auto packages_dir = mount.root() + "/Packages";
  OI_EXPECTF(DirectoryExists(packages_dir),
             "\"{}\" has no Packages directory", source_image);
  for (const auto& package : packages) {
    OI_EXPECTF(CopyPackage(package, packages_dir), "Could not add \"{}\"",
               package);
  }
  OI_EXPECT(
      WritePackageManifestList(list, packages_dir + "/OSInstall.collection"));
  if (write_automated_config) {
    OI_EXPECT(WriteAutomatedInstallConfig(packages_dir));
  }
  const auto shadow = *mount.handle().shadow_path;
  mount.Unmount();

  LOG(INFO) << "Writing " << destination;
  OI_EXPECT(
      disk_image_tool.ConvertCompressed(source_image, shadow, destination));
  return {};
}

}  // namespace

Result<void> WriteAutomatedInstallConfig(const std::string& packages_dir) {
  const auto extras = packages_dir + "/Extras";
  if (!DirectoryExists(extras)) {
    OI_EXPECT(EnsureDirectoryExists(extras));
  }
  Json::Value config(Json::objectValue);
  config["InstallType"] = "automated";
  config["Language"] = "en";
  config["Package"] =
      std::string(kInstallationPackages) + "/OSInstall.collection";
  config["Target"] = kAutomatedInstallTarget;
  OI_EXPECT(WritePlistFile(config, extras + "/minstallconfig.xml"));
  return {};
}

Result<void> Inject(VolumeManager& volume_manager,
                    DiskImageTool& disk_image_tool,
                    const std::string& source_image,
                    const std::vector<std::string>& packages,
                    const std::string& destination,
                    bool write_automated_config) {
  OI_EXPECTF(InjectIntoImage(volume_manager, disk_image_tool, source_image,
                             packages, destination, write_automated_config),
             "Package injection into \"{}\" failed", destination);
  return {};
}

}  // namespace osinstall
