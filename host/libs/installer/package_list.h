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

namespace osinstall {

// Where the installer environment finds the packages of the install image.
inline constexpr char kInstallationPackages[] =
    "/System/Installation/Packages";

// Ordered references to the packages the automated installer runs. The
// vendor manifest comes first, listed twice, then every extra package by
// basename.
std::vector<std::string> BuildPackageManifestList(
    const std::vector<std::string>& packages);

// The list is stored as a property list array.
Result<void> WritePackageManifestList(const std::vector<std::string>& list,
                                      const std::string& path);
Result<std::vector<std::string>> ReadPackageManifestList(
    const std::string& path);

}  // namespace osinstall
