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

#include <sys/stat.h>

#include <memory>
#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <libxml/tree.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/plist.h"
#include "common/libs/utils/result_matchers.h"
#include "common/libs/utils/workspace.h"
#include "common/libs/utils/xml.h"
#include "host/libs/installer/fake_package_tool.h"

namespace osinstall {
namespace {

using ::testing::HasSubstr;
using ::testing::Not;

constexpr char kScript[] = R"(<script>
function installCheck() {
    if (system.env.COMMAND_LINE_INSTALL) { return false; }
    return my.target.COMMAND_LINE_INSTALL_DISABLED == undefined;
}
</script>)";

ManifestFragments SampleFragments() {
  ManifestFragments fragments;
  fragments.title = "SU_TITLE";
  fragments.install_script = kScript;
  fragments.installation_check =
      "<installation-check script=\"installCheck();\"/>";
  fragments.volume_check = "<volume-check script=\"volCheck();\"/>";
  return fragments;
}

std::string ReadFile(const std::string& path) {
  std::string content;
  EXPECT_TRUE(android::base::ReadFileToString(path, &content)) << path;
  return content;
}

TEST(OsDisplayNameTest, KnownAndUnknownReleases) {
  EXPECT_EQ(OsDisplayName("10.9.2"), "OS X Mavericks");
  EXPECT_EQ(OsDisplayName("10.7"), "Mac OS X Lion");
  EXPECT_EQ(OsDisplayName("10.12.6"), "macOS Sierra");
  EXPECT_EQ(OsDisplayName("10.13"), "macOS High Sierra");
  EXPECT_EQ(OsDisplayName("10.14.1"), "10.14.1");
  EXPECT_EQ(OsDisplayName("11"), "11");
}

class ArtifactAssemblerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    package_ = std::string(dir_.path) + "/InstallOSX_10.9.2_13C64.pkg";
  }

  android::base::TemporaryDir dir_;
  std::string package_;
};

TEST_F(ArtifactAssemblerTest, SkeletonLayout) {
  ASSERT_THAT(CreateBundleSkeleton(package_), IsOk());

  EXPECT_TRUE(DirectoryExists(package_ + "/Contents/Resources/en.lproj"));
  EXPECT_TRUE(
      DirectoryExists(package_ + "/Contents/Resources/OS X Install Data"));
  EXPECT_EQ(SideLoadedImagePath(package_),
            package_ + "/Contents/Resources/OS X Install Data/InstallESD.dmg");
}

TEST_F(ArtifactAssemblerTest, SkeletonRefusesExistingPath) {
  ASSERT_TRUE(android::base::WriteStringToFile("keep me", package_));

  EXPECT_THAT(CreateBundleSkeleton(package_),
              IsErrorAndMessage(HasSubstr("already exists")));
  EXPECT_EQ(ReadFile(package_), "keep me");
}

TEST_F(ArtifactAssemblerTest, Metadata) {
  ASSERT_THAT(CreateBundleSkeleton(package_), IsOk());
  VersionInfo version{"10.9.2", "13C64"};

  ASSERT_THAT(WriteMetadata(package_, version, "", kDefaultInstalledSizeKB),
              IsOk());

  auto info = ParsePlistFile(package_ + "/Contents/Info.plist");
  ASSERT_THAT(info, IsOk());
  EXPECT_EQ((*info)["CFBundleIdentifier"].asString(),
            "com.googlecode.munki.installosx");
  EXPECT_EQ((*info)["CFBundleShortVersionString"].asString(), "10.9.2");
  EXPECT_EQ((*info)["IFMajorVersion"].asInt(), 10);
  EXPECT_EQ((*info)["IFMinorVersion"].asInt(), 9);
  EXPECT_EQ((*info)["IFPkgFlagRestartAction"].asString(), "RequiredRestart");
  EXPECT_EQ((*info)["IFPkgFlagInstalledSize"].asInt64(), 8388608);
  EXPECT_EQ((*info)["IFPkgFlagAuthorizationAction"].asString(),
            "RootAuthorization");
  EXPECT_EQ((*info)["IFPkgFlagDefaultLocation"].asString(), "/");
  EXPECT_DOUBLE_EQ((*info)["IFPkgFormatVersion"].asDouble(), 0.1);

  auto description = ParsePlistFile(
      package_ + "/Contents/Resources/en.lproj/Description.plist");
  ASSERT_THAT(description, IsOk());
  EXPECT_EQ((*description)["IFPkgDescriptionTitle"].asString(),
            "Install OS X Mavericks");
  EXPECT_EQ((*description)["IFPkgDescriptionDescription"].asString(),
            "Unattended custom install of OS X Mavericks version 10.9.2 "
            "build 13C64");

  EXPECT_EQ(ReadFile(package_ + "/Contents/PkgInfo"), "pmkrpkg1");
  EXPECT_EQ(ReadFile(package_ + "/Contents/Resources/package_version"),
            "major: 1\nminor: 0\n");
}

TEST_F(ArtifactAssemblerTest, MetadataWithCustomIdentifierAndUnknownRelease) {
  ASSERT_THAT(CreateBundleSkeleton(package_), IsOk());
  VersionInfo version{"10.14.1", "18B75"};

  ASSERT_THAT(WriteMetadata(package_, version, "com.example.installosx", 42),
              IsOk());

  auto info = ParsePlistFile(package_ + "/Contents/Info.plist");
  ASSERT_THAT(info, IsOk());
  EXPECT_EQ((*info)["CFBundleIdentifier"].asString(), "com.example.installosx");
  EXPECT_EQ((*info)["IFPkgFlagInstalledSize"].asInt64(), 42);
  auto description = ParsePlistFile(
      package_ + "/Contents/Resources/en.lproj/Description.plist");
  ASSERT_THAT(description, IsOk());
  EXPECT_EQ((*description)["IFPkgDescriptionTitle"].asString(),
            "Install 10.14.1");
}

TEST_F(ArtifactAssemblerTest, EmptyPayloadFromOneDirectory) {
  ASSERT_THAT(CreateBundleSkeleton(package_), IsOk());
  auto workspace = Workspace::Create(dir_.path, "ws.");
  ASSERT_THAT(workspace, IsOk());
  FakePackageTool package_tool;

  ASSERT_THAT(WriteEmptyPayload(package_tool, *workspace, package_), IsOk());

  EXPECT_EQ(ReadFile(package_ + "/Contents/Archive.pax.gz"), "cpio:0\n");
  EXPECT_TRUE(FileExists(package_ + "/Contents/Archive.bom"));
  ASSERT_EQ(package_tool.archived_directories().size(), 1u);
  EXPECT_THAT(package_tool.archived_directories()[0],
              HasSubstr(workspace->path()));
}

TEST_F(ArtifactAssemblerTest, PayloadFailurePropagates) {
  ASSERT_THAT(CreateBundleSkeleton(package_), IsOk());
  auto workspace = Workspace::Create(dir_.path, "ws.");
  ASSERT_THAT(workspace, IsOk());
  FakePackageTool package_tool;
  package_tool.FailPayload(true);

  EXPECT_THAT(WriteEmptyPayload(package_tool, *workspace, package_),
              IsErrorAndMessage(HasSubstr("payload archive")));
}

TEST(BuildDistributionTest, SynthesizedStructure) {
  auto doc = BuildDistribution(SampleFragments(), kDefaultPackageIdentifier,
                               kDefaultInstalledSizeKB);
  ASSERT_THAT(doc, IsOk());
  auto serialized = SerializeDocument(doc->get());
  ASSERT_THAT(serialized, IsOk());

  // Well formed.
  auto reparsed = ParseXmlString(*serialized);
  ASSERT_THAT(reparsed, IsOk());
  xmlNode* root = xmlDocGetRootElement(reparsed->get());
  ASSERT_TRUE(NameIs(root, "installer-gui-script"));

  EXPECT_EQ(NodeText(FirstChildElement(root, "title")), "SU_TITLE");
  xmlNode* options = FirstChildElement(root, "options");
  ASSERT_NE(options, nullptr);
  auto options_markup = SerializeNode(reparsed->get(), options);
  EXPECT_THAT(options_markup, HasSubstr("customize=\"never\""));
  EXPECT_THAT(options_markup, HasSubstr("allow-external-scripts=\"yes\""));
  EXPECT_THAT(options_markup, HasSubstr("rootVolumeOnly=\"false\""));

  auto script = NodeText(FirstChildElement(root, "script"));
  EXPECT_THAT(script,
              HasSubstr("system.env.COMMAND_LINE_INSTALL_DISABLED)"));
  EXPECT_THAT(script, HasSubstr("my.target.COMMAND_LINE_INSTALL_DISABLED =="));
  EXPECT_THAT(script, Not(HasSubstr("_DISABLED_DISABLED")));

  EXPECT_NE(FirstChildElement(root, "installation-check"), nullptr);
  EXPECT_NE(FirstChildElement(root, "volume-check"), nullptr);
  EXPECT_NE(FirstChildElement(root, "choices-outline"), nullptr);

  xmlNode* choice = FirstChildElement(root, "choice");
  ASSERT_NE(choice, nullptr);
  auto choice_markup = SerializeNode(reparsed->get(), choice);
  EXPECT_THAT(choice_markup, HasSubstr("id=\"default\""));
  EXPECT_THAT(choice_markup, HasSubstr("start_selected=\"true\""));
  EXPECT_THAT(choice_markup, HasSubstr("start_enabled=\"false\""));

  xmlNode* pkg_ref = FirstChildElement(root, "pkg-ref");
  ASSERT_NE(pkg_ref, nullptr);
  EXPECT_THAT(SerializeNode(reparsed->get(), pkg_ref),
              HasSubstr("installKBytes=\"8388608\""));
}

TEST(BuildDistributionTest, MissingFragmentsAreSkipped) {
  ManifestFragments fragments;

  auto doc = BuildDistribution(fragments, kDefaultPackageIdentifier, 1);
  ASSERT_THAT(doc, IsOk());
  xmlNode* root = xmlDocGetRootElement(doc->get());

  EXPECT_EQ(NodeText(FirstChildElement(root, "title")), "Install OS X");
  EXPECT_EQ(FirstChildElement(root, "script"), nullptr);
  EXPECT_EQ(FirstChildElement(root, "volume-check"), nullptr);
}

TEST(BuildDistributionTest, UntrustedTextIsEscaped) {
  auto fragments = SampleFragments();
  fragments.title = "Install <OS X> & friends";

  auto doc = BuildDistribution(fragments, kDefaultPackageIdentifier, 1);
  ASSERT_THAT(doc, IsOk());
  auto serialized = SerializeDocument(doc->get());
  ASSERT_THAT(serialized, IsOk());

  EXPECT_THAT(*serialized, HasSubstr("Install &lt;OS X&gt; &amp; friends"));
  EXPECT_THAT(ParseXmlString(*serialized), IsOk());
}

TEST(BuildDistributionTest, MalformedFragmentFails) {
  auto fragments = SampleFragments();
  fragments.volume_check = "<volume-check script=\"volCheck();\">";

  EXPECT_THAT(BuildDistribution(fragments, kDefaultPackageIdentifier, 1),
              IsErrorAndMessage(HasSubstr("volume check")));
}

TEST_F(ArtifactAssemblerTest, SynthesizeManifestWritesDistribution) {
  ASSERT_THAT(CreateBundleSkeleton(package_), IsOk());

  ASSERT_THAT(SynthesizeManifest(package_, SampleFragments(), "",
                                 kDefaultInstalledSizeKB),
              IsOk());

  auto content = ReadFile(package_ + "/Contents/distribution.dist");
  EXPECT_THAT(content, HasSubstr("<installer-gui-script minSpecVersion=\"1\">"));
  EXPECT_THAT(content, HasSubstr("com.googlecode.munki.installosx"));
}

TEST_F(ArtifactAssemblerTest, LocalizedResources) {
  ASSERT_THAT(CreateBundleSkeleton(package_), IsOk());
  const auto resources = std::string(dir_.path) + "/Resources";
  ASSERT_THAT(EnsureDirectoryExists(resources + "/English.lproj"), IsOk());
  ASSERT_THAT(EnsureDirectoryExists(resources + "/French.lproj"), IsOk());
  ASSERT_TRUE(android::base::WriteStringToFile(
      "\"SU_TITLE\" = \"OS X Mavericks\";",
      resources + "/English.lproj/Localizable.strings"));
  ASSERT_TRUE(
      android::base::WriteStringToFile("ignored", resources + "/background"));

  CopyLocalizedResources(package_, resources);

  EXPECT_TRUE(FileExists(package_ +
                         "/Contents/Resources/English.lproj/"
                         "Localizable.strings"));
  EXPECT_TRUE(DirectoryExists(package_ + "/Contents/Resources/French.lproj"));
  EXPECT_FALSE(FileExists(package_ + "/Contents/Resources/background"));
}

TEST_F(ArtifactAssemblerTest, LocalizedResourcesMergeIntoGeneratedLproj) {
  ASSERT_THAT(CreateBundleSkeleton(package_), IsOk());
  ASSERT_THAT(WriteMetadata(package_, VersionInfo{"10.9.2", "13C64"}, "",
                            kDefaultInstalledSizeKB),
              IsOk());
  const auto resources = std::string(dir_.path) + "/Resources";
  ASSERT_THAT(EnsureDirectoryExists(resources + "/en.lproj/Welcome.rtfd"),
              IsOk());
  ASSERT_TRUE(android::base::WriteStringToFile(
      "\"SU_TITLE\" = \"OS X Mavericks\";",
      resources + "/en.lproj/Localizable.strings"));
  ASSERT_TRUE(android::base::WriteStringToFile(
      "vendor", resources + "/en.lproj/Description.plist"));

  CopyLocalizedResources(package_, resources);

  const auto lproj = package_ + "/Contents/Resources/en.lproj";
  EXPECT_EQ(ReadFile(lproj + "/Localizable.strings"),
            "\"SU_TITLE\" = \"OS X Mavericks\";");
  EXPECT_TRUE(DirectoryExists(lproj + "/Welcome.rtfd"));
  auto description = ParsePlistFile(lproj + "/Description.plist");
  ASSERT_THAT(description, IsOk());
  EXPECT_EQ((*description)["IFPkgDescriptionTitle"].asString(),
            "Install OS X Mavericks");
}

TEST_F(ArtifactAssemblerTest, MissingLocalizedResourcesAreTolerated) {
  ASSERT_THAT(CreateBundleSkeleton(package_), IsOk());

  CopyLocalizedResources(package_, std::string(dir_.path) + "/missing");

  EXPECT_TRUE(DirectoryExists(package_ + "/Contents/Resources/en.lproj"));
}

TEST_F(ArtifactAssemblerTest, PostinstallScript) {
  ASSERT_THAT(CreateBundleSkeleton(package_), IsOk());

  ASSERT_THAT(WritePostinstallScript(package_), IsOk());

  const auto script = package_ + "/Contents/Resources/postinstall";
  auto content = ReadFile(script);
  EXPECT_THAT(content, ::testing::StartsWith("#!/bin/sh\n"));
  EXPECT_THAT(content, HasSubstr("OS X Install Data"));
  EXPECT_THAT(content, HasSubstr("/usr/sbin/bless"));
  struct stat st {};
  ASSERT_EQ(stat(script.c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 0777, 0755u);
}

TEST_F(ArtifactAssemblerTest, GuardRemovesUncommittedOutput) {
  {
    OutputArtifactGuard guard(package_, /* keep_on_failure */ false);
    ASSERT_THAT(CreateBundleSkeleton(package_), IsOk());
  }
  EXPECT_FALSE(FileExists(package_));

  const auto image = std::string(dir_.path) + "/InstallOSX.dmg";
  {
    OutputArtifactGuard guard(image, /* keep_on_failure */ false);
    ASSERT_TRUE(android::base::WriteStringToFile("UDZO", image));
  }
  EXPECT_FALSE(FileExists(image));
}

TEST_F(ArtifactAssemblerTest, GuardKeepsCommittedOrDebugOutput) {
  {
    OutputArtifactGuard guard(package_, /* keep_on_failure */ false);
    ASSERT_THAT(CreateBundleSkeleton(package_), IsOk());
    guard.Commit();
  }
  EXPECT_TRUE(DirectoryExists(package_));

  const auto image = std::string(dir_.path) + "/InstallOSX.dmg";
  {
    OutputArtifactGuard guard(image, /* keep_on_failure */ true);
    ASSERT_TRUE(android::base::WriteStringToFile("UDZO", image));
  }
  EXPECT_TRUE(FileExists(image));
}

}  // namespace
}  // namespace osinstall
