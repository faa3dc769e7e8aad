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

#include "host/libs/installer/fake_package_tool.h"

#include <string>

#include <android-base/file.h>

#include "common/libs/utils/files.h"

namespace osinstall {

void FakePackageTool::AddPackage(const std::string& package,
                                 const std::string& expanded) {
  packages_[package] = expanded;
}

Result<void> FakePackageTool::Expand(const std::string& package,
                                     const std::string& destination) {
  auto it = packages_.find(package);
  if (it == packages_.end()) {
    it = packages_.find(cpp_basename(package));
  }
  OI_EXPECTF(it != packages_.end(), "pkgutil: Error opening file {}",
             package);
  OI_EXPECT(CopyDirectoryRecursively(it->second, destination));
  expanded_.push_back(package);
  return {};
}

Result<void> FakePackageTool::CreatePayloadArchive(
    const std::string& directory, const std::string& archive) {
  OI_EXPECT(!fail_payload_, "pax: Unable to access");
  OI_EXPECTF(DirectoryExists(directory), "pax: {} is not a directory",
             directory);
  auto contents = OI_EXPECT(DirectoryContents(directory));
  OI_EXPECT(android::base::WriteStringToFile(
      "cpio:" + std::to_string(contents.size()) + "\n", archive));
  archived_directories_.push_back(directory);
  return {};
}

Result<void> FakePackageTool::CreateBom(const std::string& directory,
                                        const std::string& bom) {
  OI_EXPECTF(DirectoryExists(directory), "mkbom: {} is not a directory",
             directory);
  OI_EXPECT(android::base::WriteStringToFile("BOMStore", bom));
  return {};
}

}  // namespace osinstall
