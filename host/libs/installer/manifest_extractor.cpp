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

#include "host/libs/installer/manifest_extractor.h"

#include <initializer_list>
#include <string>

#include <android-base/logging.h>
#include <android-base/strings.h>
#include <json/json.h>
#include <libxml/tree.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/plist.h"
#include "common/libs/utils/xml.h"

namespace osinstall {
namespace {

constexpr char kSystemVersionPlist[] =
    "/System/Library/CoreServices/SystemVersion.plist";
constexpr char kBaseSystemImage[] = "/BaseSystem.dmg";

Result<std::string> RequiredString(const Json::Value& dict,
                                   const std::string& key,
                                   const std::string& path) {
  OI_EXPECTF(dict.isObject() && dict.isMember(key),
             "\"{}\" has no {}", path, key);
  OI_EXPECTF(dict[key].isString(), "{} in \"{}\" is not a string", key, path);
  auto value = android::base::Trim(dict[key].asString());
  OI_EXPECTF(!value.empty(), "{} in \"{}\" is empty", key, path);
  return value;
}

std::optional<std::string> OptionalString(const Json::Value& dict,
                                          const std::string& key) {
  if (!dict.isObject() || !dict[key].isString()) {
    return {};
  }
  return dict[key].asString();
}

// First top level element `name` of the manifest, serialized.
std::string Fragment(xmlDoc* doc, xmlNode* root, const char* name) {
  xmlNode* node = FirstChildElement(root, name);
  if (node == nullptr) {
    LOG(WARNING) << "Installer manifest has no <" << name << ">";
    return "";
  }
  return SerializeNode(doc, node);
}

std::string FirstExisting(const std::string& base,
                          std::initializer_list<const char*> candidates) {
  for (const char* candidate : candidates) {
    auto path = base + candidate;
    if (FileExists(path)) {
      return path;
    }
  }
  return base + *candidates.begin();
}

}  // namespace

Result<VersionInfo> ExtractVersionInfo(const std::string& path) {
  auto plist_path = DirectoryExists(path) ? path + kSystemVersionPlist : path;
  auto plist = OI_EXPECTF(ParsePlistFile(plist_path),
                          "Could not read the OS version from \"{}\"",
                          plist_path);
  VersionInfo info;
  info.product_version =
      OI_EXPECT(RequiredString(plist, "ProductVersion", plist_path));
  info.build_number =
      OI_EXPECT(RequiredString(plist, "ProductBuildVersion", plist_path));
  return info;
}

Result<VersionInfo> ReadInstallImageVersion(
    VolumeManager& volume_manager, const std::string& install_image_root) {
  const auto base_system = install_image_root + kBaseSystemImage;
  auto mount = OI_EXPECT(
      volume_manager.MountScoped(base_system, /* use_shadow */ false),
      "Could not mount the base system of the install image");
  auto info = OI_EXPECT(ExtractVersionInfo(mount.root()));
  LOG(INFO) << "Installer is version " << info.product_version << " build "
            << info.build_number;
  return info;
}

ManifestFragments ExtractManifestFragments(const std::string& distribution) {
  ManifestFragments fragments;
  auto doc = ParseXmlFile(distribution);
  if (!doc.ok()) {
    LOG(ERROR) << "Could not parse the installer manifest, using defaults: "
               << doc.error().Message();
    return fragments;
  }
  xmlNode* root = xmlDocGetRootElement(doc->get());
  auto title = android::base::Trim(NodeText(FirstChildElement(root, "title")));
  if (!title.empty()) {
    fragments.title = title;
  }
  fragments.install_script = Fragment(doc->get(), root, "script");
  fragments.installation_check =
      Fragment(doc->get(), root, "installation-check");
  fragments.volume_check = Fragment(doc->get(), root, "volume-check");
  return fragments;
}

InstallerOptions ExtractInstallerOptions(const std::string& path) {
  InstallerOptions options;
  auto plist = ParsePlistFile(path);
  if (!plist.ok()) {
    LOG(WARNING) << "Ignoring installer options: " << plist.error().Message();
    return options;
  }
  const Json::Value& image_info = (*plist)["System Image Info"];
  options.os_version = OptionalString(image_info, "version");
  options.os_build_version = OptionalString(image_info, "build");
  return options;
}

Result<ExpandedManifest> ExpandManifest(PackageTool& package_tool,
                                        const Workspace& workspace,
                                        const std::string& manifest) {
  OI_EXPECTF(FileExists(manifest), "Installer manifest \"{}\" does not exist",
             manifest);
  std::string root = manifest;
  if (!DirectoryExists(manifest)) {
    root = workspace.PathFor("expanded_" + cpp_basename(manifest));
    OI_EXPECT(package_tool.Expand(manifest, root));
  }
  ExpandedManifest expanded;
  expanded.distribution =
      FirstExisting(root, {"/Distribution", "/Contents/distribution.dist"});
  expanded.resources =
      FirstExisting(root, {"/Resources", "/Contents/Resources"});
  OI_EXPECTF(FileExists(expanded.distribution),
             "No installer manifest found in \"{}\"", manifest);
  return expanded;
}

}  // namespace osinstall
