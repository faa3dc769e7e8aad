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
#include <vector>

#include <json/json.h>

#include "common/libs/utils/result.h"

namespace osinstall {

// Options of a single build, from a configuration file, the command line or
// both.
struct BuildOptions {
  std::string source;
  std::string output;
  std::vector<std::string> packages;
  std::string identifier;
  bool disk_image = false;
};

// Options present in a configuration file. Unset fields leave the command
// line values alone.
struct ConfigFileOptions {
  std::optional<std::string> source;
  std::optional<std::string> output;
  std::optional<std::vector<std::string>> packages;
  std::optional<std::string> identifier;
  std::optional<bool> disk_image;
};

Result<ConfigFileOptions> ConfigFileOptionsFromJson(const Json::Value& root);

// Files ending in .json are read as JSON, anything else as a property list.
Result<ConfigFileOptions> LoadConfigFile(const std::string& path);

// Fills every option of `options` the command line left at its default from
// `config`.
void ApplyConfigFile(const ConfigFileOptions& config,
                     const std::vector<std::string>& explicit_flags,
                     BuildOptions* options);

// Extra packages must exist, be installer packages and have distinct
// basenames other than that of the vendor manifest.
Result<void> ValidatePackages(const std::vector<std::string>& packages);

std::string DefaultOutputPath(const std::string& directory,
                              const std::string& product_version,
                              const std::string& build_number,
                              bool disk_image);

// Makes every path in `options` absolute and checks the source and packages.
Result<BuildOptions> NormalizeBuildOptions(BuildOptions options);

}  // namespace osinstall
