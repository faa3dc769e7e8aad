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

#include "host/libs/config/build_config.h"

#include <algorithm>
#include <set>
#include <string>
#include <vector>

#include <android-base/logging.h>
#include <android-base/strings.h>
#include <fmt/core.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/json.h"
#include "common/libs/utils/plist.h"

namespace osinstall {
namespace {

constexpr char kVendorManifestName[] = "OSInstall.mpkg";

bool IsExplicit(const std::vector<std::string>& explicit_flags,
                const std::string& name) {
  return std::find(explicit_flags.begin(), explicit_flags.end(), name) !=
         explicit_flags.end();
}

Result<std::optional<std::string>> OptionalStringMember(
    const Json::Value& root, const std::string& key) {
  if (!HasValue(root, {key})) {
    return std::optional<std::string>();
  }
  OI_EXPECTF(root[key].isString(), "\"{}\" must be a string", key);
  return std::optional<std::string>(root[key].asString());
}

}  // namespace

Result<ConfigFileOptions> ConfigFileOptionsFromJson(const Json::Value& root) {
  OI_EXPECT(root.isObject(), "Configuration must be a dictionary");
  ConfigFileOptions config;
  config.source = OI_EXPECT(OptionalStringMember(root, "source"));
  config.output = OI_EXPECT(OptionalStringMember(root, "output"));
  config.identifier = OI_EXPECT(OptionalStringMember(root, "identifier"));
  if (HasValue(root, {"disk_image"})) {
    OI_EXPECT(root["disk_image"].isBool(), "\"disk_image\" must be a boolean");
    config.disk_image = OI_EXPECT(GetValue<bool>(root, {"disk_image"}));
  }
  if (HasValue(root, {"packages"})) {
    const Json::Value& packages = root["packages"];
    OI_EXPECT(packages.isArray(), "\"packages\" must be a list");
    std::vector<std::string> list;
    for (const auto& package : packages) {
      OI_EXPECT(package.isString(), "\"packages\" must only hold strings");
      list.push_back(package.asString());
    }
    config.packages = std::move(list);
  }
  for (const auto& member : root.getMemberNames()) {
    static const std::vector<std::string> kKnownKeys = {
        "source", "output", "packages", "identifier", "disk_image"};
    if (std::find(kKnownKeys.begin(), kKnownKeys.end(), member) ==
        kKnownKeys.end()) {
      LOG(WARNING) << "Ignoring unknown configuration key \"" << member
                   << "\"";
    }
  }
  return config;
}

Result<ConfigFileOptions> LoadConfigFile(const std::string& path) {
  Json::Value root;
  if (android::base::EndsWith(path, ".json")) {
    root = OI_EXPECT(LoadFromFile(path));
  } else {
    root = OI_EXPECT(ParsePlistFile(path));
  }
  return OI_EXPECTF(ConfigFileOptionsFromJson(root),
                    "Invalid configuration file \"{}\"", path);
}

void ApplyConfigFile(const ConfigFileOptions& config,
                     const std::vector<std::string>& explicit_flags,
                     BuildOptions* options) {
  if (config.source && !IsExplicit(explicit_flags, "source")) {
    options->source = *config.source;
  }
  if (config.output && !IsExplicit(explicit_flags, "output")) {
    options->output = *config.output;
  }
  if (config.packages && !IsExplicit(explicit_flags, "packages")) {
    options->packages = *config.packages;
  }
  if (config.identifier && !IsExplicit(explicit_flags, "identifier")) {
    options->identifier = *config.identifier;
  }
  if (config.disk_image && !IsExplicit(explicit_flags, "disk_image")) {
    options->disk_image = *config.disk_image;
  }
}

Result<void> ValidatePackages(const std::vector<std::string>& packages) {
  std::set<std::string> names;
  for (const auto& package : packages) {
    OI_EXPECTF(FileExists(package), "Package \"{}\" does not exist", package);
    const auto name = cpp_basename(package);
    OI_EXPECTF(android::base::EndsWith(name, ".pkg") ||
                   android::base::EndsWith(name, ".mpkg"),
               "\"{}\" is not an installer package", package);
    OI_EXPECTF(name != kVendorManifestName,
               "\"{}\" would replace the vendor installer manifest", package);
    // Packages are installed by basename.
    OI_EXPECTF(names.insert(name).second,
               "More than one package is named \"{}\"", name);
  }
  return {};
}

std::string DefaultOutputPath(const std::string& directory,
                              const std::string& product_version,
                              const std::string& build_number,
                              bool disk_image) {
  return fmt::format("{}/InstallOSX_{}_{}.{}", directory, product_version,
                     build_number, disk_image ? "dmg" : "pkg");
}

Result<BuildOptions> NormalizeBuildOptions(BuildOptions options) {
  OI_EXPECT(!options.source.empty(),
            "An installer application or InstallESD.dmg is required");
  options.source = AbsolutePath(options.source);
  if (!options.output.empty()) {
    options.output = AbsolutePath(options.output);
  }
  for (auto& package : options.packages) {
    package = AbsolutePath(package);
    while (package.size() > 1 && package.back() == '/') {
      package.pop_back();
    }
  }
  OI_EXPECT(ValidatePackages(options.packages));
  return options;
}

}  // namespace osinstall
