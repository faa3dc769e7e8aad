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

#include "host/libs/installer/artifact_assembler.h"

#include <string.h>
#include <sys/stat.h>

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/parseint.h>
#include <android-base/strings.h>
#include <json/json.h>
#include <libxml/parser.h>
#include <libxml/tree.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/plist.h"

namespace osinstall {
namespace {

constexpr char kResources[] = "/Contents/Resources";
constexpr char kLocalizedResources[] = "/Contents/Resources/en.lproj";
constexpr char kInstallData[] = "/Contents/Resources/OS X Install Data";
constexpr char kCommandLineGuard[] = "COMMAND_LINE_INSTALL";
constexpr char kDisabledSuffix[] = "_DISABLED";

const std::map<std::string, std::string> kOsDisplayNames = {
    {"10.7", "Mac OS X Lion"},    {"10.8", "OS X Mountain Lion"},
    {"10.9", "OS X Mavericks"},   {"10.10", "OS X Yosemite"},
    {"10.11", "OS X El Capitan"}, {"10.12", "macOS Sierra"},
    {"10.13", "macOS High Sierra"},
};

constexpr char kPostinstallScript[] = R"script(#!/bin/sh
# Stages the install image carried by this package on the target volume and
# blesses it so the next boot starts the unattended installer.

PACKAGE_PATH="$1"
TARGET="$3"
SOURCE_DATA="$PACKAGE_PATH/Contents/Resources/OS X Install Data"
INSTALL_DATA="$TARGET/OS X Install Data"
BOOT_CONFIG="$INSTALL_DATA/com.apple.Boot.plist"

/bin/mkdir -p "$INSTALL_DATA" || exit 1
/bin/cp "$SOURCE_DATA/InstallESD.dmg" "$INSTALL_DATA/InstallESD.dmg" || exit 1

MOUNT_POINT=$(/usr/bin/mktemp -d /tmp/osinstall.XXXXXX) || exit 1
/usr/bin/hdiutil attach "$INSTALL_DATA/InstallESD.dmg" -mountpoint \
    "$MOUNT_POINT" -nobrowse -noverify -noautoopen || exit 1
/bin/cp "$MOUNT_POINT/.IABootFiles/kernelcache" "$INSTALL_DATA/" &&
    /bin/cp "$MOUNT_POINT/.IABootFiles/boot.efi" "$INSTALL_DATA/"
STATUS=$?
if [ -e "$MOUNT_POINT/Packages/OSInstall.collection" ]; then
  PACKAGE=/System/Installation/Packages/OSInstall.collection
else
  PACKAGE=/System/Installation/Packages/OSInstall.mpkg
fi
/usr/bin/hdiutil detach "$MOUNT_POINT" || /usr/bin/hdiutil detach -force "$MOUNT_POINT"
/bin/rmdir "$MOUNT_POINT"
[ $STATUS -eq 0 ] || exit 1

/bin/cat > "$INSTALL_DATA/minstallconfig.xml" <<EOF
<?xml version="1.0" encoding="UTF-8"?>
<!DOCTYPE plist PUBLIC "-//Apple//DTD PLIST 1.0//EN" "http://www.apple.com/DTDs/PropertyList-1.0.dtd">
<plist version="1.0">
<dict>
	<key>InstallType</key>
	<string>automated</string>
	<key>Language</key>
	<string>en</string>
	<key>Package</key>
	<string>$PACKAGE</string>
</dict>
</plist>
EOF

/usr/bin/defaults write "${BOOT_CONFIG%.plist}" "Kernel Cache" \
    '/OS X Install Data/kernelcache'
/usr/bin/defaults write "${BOOT_CONFIG%.plist}" "Kernel Flags" \
    'container-dmg=file:///OS%20X%20Install%20Data/InstallESD.dmg root-dmg=file:///BaseSystem.dmg'
/usr/bin/plutil -convert xml1 "$BOOT_CONFIG"
/bin/chmod 644 "$BOOT_CONFIG"

/usr/sbin/bless --mount "$TARGET" --setBoot --file "$INSTALL_DATA/boot.efi" \
    --options 'config="\OS X Install Data\com.apple.Boot"' \
    --label 'OS X Installer' || exit 1
exit 0
)script";

int VersionComponent(const std::vector<std::string>& components, size_t index) {
  int value = 0;
  if (index >= components.size() ||
      !android::base::ParseInt(components[index], &value)) {
    return 0;
  }
  return value;
}

// Appends kDisabledSuffix to every occurrence of the command line install
// guard that does not carry it yet.
std::string RenameCommandLineGuard(const std::string& text) {
  const size_t guard_length = strlen(kCommandLineGuard);
  const size_t suffix_length = strlen(kDisabledSuffix);
  std::string renamed;
  size_t position = 0;
  size_t found;
  while ((found = text.find(kCommandLineGuard, position)) !=
         std::string::npos) {
    size_t end = found + guard_length;
    renamed.append(text, position, end - position);
    if (text.compare(end, suffix_length, kDisabledSuffix) != 0) {
      renamed.append(kDisabledSuffix);
    }
    position = end;
  }
  renamed.append(text, position, std::string::npos);
  return renamed;
}

void DisableCommandLineInstall(xmlNode* node) {
  for (xmlNode* child = node->children; child != nullptr;
       child = child->next) {
    if (child->type == XML_TEXT_NODE || child->type == XML_CDATA_SECTION_NODE) {
      auto text = NodeText(child);
      auto renamed = RenameCommandLineGuard(text);
      if (renamed != text) {
        xmlNodeSetContentLen(child, XmlStr(renamed.c_str()),
                             static_cast<int>(renamed.size()));
      }
    } else if (child->type == XML_ELEMENT_NODE) {
      DisableCommandLineInstall(child);
    }
  }
}

// Copies the entries of `from` missing in `to`. Entries already present in
// `to` are kept.
Result<void> MergeDirectory(const std::string& from, const std::string& to) {
  if (!FileExists(to, /* follow_symlinks */ false)) {
    return CopyDirectoryRecursively(from, to);
  }
  OI_EXPECTF(DirectoryExists(to, /* follow_symlinks */ false),
             "\"{}\" is not a directory", to);
  for (const auto& name : OI_EXPECT(DirectoryContents(from))) {
    const auto source = from + "/" + name;
    const auto destination = to + "/" + name;
    if (FileExists(destination, /* follow_symlinks */ false)) {
      LOG(DEBUG) << "Keeping existing " << destination;
      continue;
    }
    if (DirectoryExists(source, /* follow_symlinks */ false)) {
      OI_EXPECT(CopyDirectoryRecursively(source, destination));
    } else {
      OI_EXPECT(Copy(source, destination));
    }
  }
  return {};
}

// Parses `fragment` and appends a copy of its element to `parent`.
Result<xmlNode*> ImportFragment(xmlNode* parent, const std::string& fragment,
                                const std::string& description) {
  auto fragment_doc =
      OI_EXPECTF(ParseXmlString(fragment),
                 "The {} of the installer manifest is not well formed",
                 description);
  xmlNode* copy = xmlDocCopyNode(xmlDocGetRootElement(fragment_doc.get()),
                                 parent->doc, /* recursive */ 1);
  OI_EXPECTF(copy != nullptr, "Could not copy the {}", description);
  xmlAddChild(parent, copy);
  return copy;
}

}  // namespace

std::string OsDisplayName(const std::string& version) {
  auto components = android::base::Split(version, ".");
  if (components.size() >= 2) {
    auto it = kOsDisplayNames.find(components[0] + "." + components[1]);
    if (it != kOsDisplayNames.end()) {
      return it->second;
    }
  }
  return version;
}

OutputArtifactGuard::OutputArtifactGuard(std::string path,
                                         bool keep_on_failure)
    : path_(std::move(path)), keep_on_failure_(keep_on_failure) {}

OutputArtifactGuard::~OutputArtifactGuard() {
  if (committed_ || !FileExists(path_, /* follow_symlinks */ false)) {
    return;
  }
  if (keep_on_failure_) {
    LOG(WARNING) << "Keeping partial output " << path_;
    return;
  }
  LOG(INFO) << "Removing partial output " << path_;
  if (DirectoryExists(path_, /* follow_symlinks */ false)) {
    auto removed = RecursivelyRemoveDirectory(path_);
    if (!removed.ok()) {
      LOG(ERROR) << removed.error().Message();
    }
  } else if (!RemoveFile(path_)) {
    PLOG(ERROR) << "Could not remove " << path_;
  }
}

Result<void> CreateBundleSkeleton(const std::string& path) {
  OI_EXPECTF(!FileExists(path, /* follow_symlinks */ false),
             "\"{}\" already exists", path);
  OI_EXPECT(EnsureDirectoryExists(path + kLocalizedResources));
  OI_EXPECT(EnsureDirectoryExists(path + kInstallData));
  return {};
}

Result<void> WriteMetadata(const std::string& path, const VersionInfo& version,
                           const std::string& package_id,
                           int64_t installed_size_kb) {
  auto components = android::base::Split(version.product_version, ".");

  Json::Value info(Json::objectValue);
  info["CFBundleIdentifier"] =
      package_id.empty() ? kDefaultPackageIdentifier : package_id;
  info["CFBundleShortVersionString"] = version.product_version;
  info["IFMajorVersion"] = VersionComponent(components, 0);
  info["IFMinorVersion"] = VersionComponent(components, 1);
  info["IFPkgFlagRestartAction"] = "RequiredRestart";
  info["IFPkgFlagInstalledSize"] = Json::Value(Json::Int64{installed_size_kb});
  info["IFPkgFlagAuthorizationAction"] = "RootAuthorization";
  info["IFPkgFlagDefaultLocation"] = "/";
  info["IFPkgFormatVersion"] = 0.1;
  OI_EXPECT(WritePlistFile(info, path + "/Contents/Info.plist"));

  const auto name = OsDisplayName(version.product_version);
  Json::Value description(Json::objectValue);
  description["IFPkgDescriptionTitle"] = "Install " + name;
  description["IFPkgDescriptionDescription"] =
      fmt::format("Unattended custom install of {} version {} build {}", name,
                  version.product_version, version.build_number);
  OI_EXPECT(WritePlistFile(description,
                           path + kLocalizedResources + "/Description.plist"));

  OI_EXPECT(android::base::WriteStringToFile("pmkrpkg1",
                                             path + "/Contents/PkgInfo"));
  OI_EXPECT(android::base::WriteStringToFile(
      "major: 1\nminor: 0\n", path + kResources + "/package_version"));
  return {};
}

Result<void> WriteEmptyPayload(PackageTool& package_tool,
                               const Workspace& workspace,
                               const std::string& path) {
  auto empty = OI_EXPECT(workspace.CreateDirectory("empty_payload"));
  OI_EXPECT(package_tool.CreatePayloadArchive(
                empty, path + "/Contents/Archive.pax.gz"),
            "Could not write the payload archive");
  OI_EXPECT(package_tool.CreateBom(empty, path + "/Contents/Archive.bom"),
            "Could not write the bill of materials");
  return {};
}

Result<XmlDocPtr> BuildDistribution(const ManifestFragments& fragments,
                                    const std::string& package_id,
                                    int64_t installed_size_kb) {
  auto doc = NewXmlDocument();
  OI_EXPECT(doc != nullptr, "Could not allocate the installer manifest");
  xmlNode* root = xmlNewNode(nullptr, XmlStr("installer-gui-script"));
  xmlNewProp(root, XmlStr("minSpecVersion"), XmlStr("1"));
  xmlDocSetRootElement(doc.get(), root);

  xmlNewTextChild(root, nullptr, XmlStr("title"),
                  XmlStr(fragments.title.c_str()));
  xmlNode* options = xmlNewChild(root, nullptr, XmlStr("options"), nullptr);
  xmlNewProp(options, XmlStr("customize"), XmlStr("never"));
  xmlNewProp(options, XmlStr("allow-external-scripts"), XmlStr("yes"));
  xmlNewProp(options, XmlStr("rootVolumeOnly"), XmlStr("false"));

  if (!fragments.install_script.empty()) {
    xmlNode* script =
        OI_EXPECT(ImportFragment(root, fragments.install_script, "script"));
    DisableCommandLineInstall(script);
  }
  if (!fragments.installation_check.empty()) {
    OI_EXPECT(ImportFragment(root, fragments.installation_check,
                             "installation check"));
  }
  if (!fragments.volume_check.empty()) {
    OI_EXPECT(ImportFragment(root, fragments.volume_check, "volume check"));
  }

  xmlNode* outline =
      xmlNewChild(root, nullptr, XmlStr("choices-outline"), nullptr);
  xmlNode* line = xmlNewChild(outline, nullptr, XmlStr("line"), nullptr);
  xmlNewProp(line, XmlStr("choice"), XmlStr("default"));

  xmlNode* choice = xmlNewChild(root, nullptr, XmlStr("choice"), nullptr);
  xmlNewProp(choice, XmlStr("id"), XmlStr("default"));
  xmlNewProp(choice, XmlStr("title"), XmlStr(fragments.title.c_str()));
  xmlNewProp(choice, XmlStr("start_selected"), XmlStr("true"));
  xmlNewProp(choice, XmlStr("start_enabled"), XmlStr("false"));
  xmlNode* choice_ref =
      xmlNewChild(choice, nullptr, XmlStr("pkg-ref"), nullptr);
  xmlNewProp(choice_ref, XmlStr("id"), XmlStr(package_id.c_str()));

  const auto size = std::to_string(installed_size_kb);
  xmlNode* pkg_ref =
      xmlNewTextChild(root, nullptr, XmlStr("pkg-ref"), XmlStr("#"));
  xmlNewProp(pkg_ref, XmlStr("id"), XmlStr(package_id.c_str()));
  xmlNewProp(pkg_ref, XmlStr("installKBytes"), XmlStr(size.c_str()));
  xmlNewProp(pkg_ref, XmlStr("auth"), XmlStr("Root"));
  xmlNewProp(pkg_ref, XmlStr("onConclusion"), XmlStr("RequireRestart"));
  return std::move(doc);
}

Result<void> SynthesizeManifest(const std::string& path,
                                const ManifestFragments& fragments,
                                const std::string& package_id,
                                int64_t installed_size_kb) {
  auto doc = OI_EXPECT(BuildDistribution(
      fragments, package_id.empty() ? kDefaultPackageIdentifier : package_id,
      installed_size_kb));
  OI_EXPECT(WriteXmlFile(doc.get(), path + "/Contents/distribution.dist"));
  return {};
}

void CopyLocalizedResources(const std::string& path,
                            const std::string& resources) {
  auto contents = DirectoryContents(resources);
  if (!contents.ok()) {
    LOG(WARNING) << "No localized resources copied: "
                 << contents.error().Message();
    return;
  }
  for (const auto& name : *contents) {
    if (!android::base::EndsWith(name, ".lproj")) {
      continue;
    }
    const auto destination = path + kResources + "/" + name;
    auto copied = MergeDirectory(resources + "/" + name, destination);
    if (!copied.ok()) {
      LOG(WARNING) << "Could not copy " << name << ": "
                   << copied.error().Message();
    }
  }
}

Result<void> WritePostinstallScript(const std::string& path) {
  const auto script = path + kResources + "/postinstall";
  OI_EXPECTF(android::base::WriteStringToFile(kPostinstallScript, script),
             "Could not write \"{}\"", script);
  OI_EXPECT(MakeFileExecutable(script));
  return {};
}

std::string SideLoadedImagePath(const std::string& path) {
  return path + kInstallData + "/InstallESD.dmg";
}

}  // namespace osinstall
