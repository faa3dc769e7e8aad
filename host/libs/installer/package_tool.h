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

#include <fruit/fruit.h>

#include "common/libs/utils/result.h"

namespace osinstall {

// Installer package tooling. The system implementation uses pkgutil, pax and
// mkbom.
class PackageTool {
 public:
  virtual ~PackageTool() = default;

  // Unpacks the flat package `package` into the not yet existing directory
  // `destination`.
  virtual Result<void> Expand(const std::string& package,
                              const std::string& destination) = 0;
  // Writes a gzip compressed cpio archive of the content of `directory`.
  virtual Result<void> CreatePayloadArchive(const std::string& directory,
                                            const std::string& archive) = 0;
  // Writes the bill of materials of `directory` to `bom`.
  virtual Result<void> CreateBom(const std::string& directory,
                                 const std::string& bom) = 0;
};

fruit::Component<PackageTool> SystemPackageToolComponent();

}  // namespace osinstall
