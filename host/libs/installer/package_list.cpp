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

#include "host/libs/installer/package_list.h"

#include <string>
#include <vector>

#include <json/json.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/plist.h"

namespace osinstall {

std::vector<std::string> BuildPackageManifestList(
    const std::vector<std::string>& packages) {
  const std::string vendor_manifest =
      std::string(kInstallationPackages) + "/OSInstall.mpkg";
  std::vector<std::string> list = {vendor_manifest, vendor_manifest};
  for (const auto& package : packages) {
    list.push_back(std::string(kInstallationPackages) + "/" +
                   cpp_basename(package));
  }
  return list;
}

Result<void> WritePackageManifestList(const std::vector<std::string>& list,
                                      const std::string& path) {
  Json::Value array(Json::arrayValue);
  for (const auto& entry : list) {
    array.append(entry);
  }
  OI_EXPECTF(WritePlistFile(array, path),
             "Could not write the package list to \"{}\"", path);
  return {};
}

Result<std::vector<std::string>> ReadPackageManifestList(
    const std::string& path) {
  auto array = OI_EXPECT(ParsePlistFile(path));
  OI_EXPECTF(array.isArray(), "\"{}\" does not hold a list", path);
  std::vector<std::string> list;
  for (const auto& entry : array) {
    OI_EXPECTF(entry.isString(), "\"{}\" holds a non-string entry", path);
    list.push_back(entry.asString());
  }
  return list;
}

}  // namespace osinstall
