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

#include <map>
#include <string>
#include <vector>

#include "common/libs/utils/result.h"
#include "host/libs/installer/package_tool.h"

namespace osinstall {

// Expands packages by copying registered directory trees and writes marker
// files in place of archives and bills of materials.
class FakePackageTool : public PackageTool {
 public:
  FakePackageTool() = default;

  // Packages are looked up by full path first, then by basename.
  void AddPackage(const std::string& package, const std::string& expanded);
  void FailPayload(bool fail) { fail_payload_ = fail; }

  Result<void> Expand(const std::string& package,
                      const std::string& destination) override;
  Result<void> CreatePayloadArchive(const std::string& directory,
                                    const std::string& archive) override;
  Result<void> CreateBom(const std::string& directory,
                         const std::string& bom) override;

  const std::vector<std::string>& expanded() const { return expanded_; }
  const std::vector<std::string>& archived_directories() const {
    return archived_directories_;
  }

 private:
  std::map<std::string, std::string> packages_;
  std::vector<std::string> expanded_;
  std::vector<std::string> archived_directories_;
  bool fail_payload_ = false;
};

}  // namespace osinstall
