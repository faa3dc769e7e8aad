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

#include "host/libs/installer/injection.h"

#include <memory>
#include <string>
#include <vector>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/plist.h"
#include "common/libs/utils/result_matchers.h"
#include "common/libs/utils/workspace.h"
#include "host/libs/image/fake_disk_image_tool.h"
#include "host/libs/image/volume_manager.h"
#include "host/libs/installer/package_list.h"

namespace osinstall {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

class InjectionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto workspace = Workspace::Create(scratch_.path, "ws.");
    ASSERT_THAT(workspace, IsOk());
    workspace_ = std::make_unique<Workspace>(std::move(*workspace));
    manager_ = std::make_unique<VolumeManager>(tool_, *workspace_);

    const std::string root = scratch_.path;
    image_ = root + "/InstallESD.dmg";
    ASSERT_TRUE(android::base::WriteStringToFile("udif", image_));
    volume_ = root + "/esd";
    ASSERT_THAT(EnsureDirectoryExists(volume_ + "/Packages/OSInstall.mpkg"),
                IsOk());
    ASSERT_TRUE(android::base::WriteStringToFile(
        "base", volume_ + "/Packages/BaseSystemBinaries.pkg"));
    tool_.AddImage(image_, {volume_});

    flat_package_ = root + "/Munki.pkg";
    ASSERT_TRUE(android::base::WriteStringToFile("xar!", flat_package_));
    bundle_package_ = root + "/Bootstrap.mpkg";
    ASSERT_THAT(EnsureDirectoryExists(bundle_package_ + "/Contents"), IsOk());
    ASSERT_TRUE(android::base::WriteStringToFile(
        "pmkrpkg1", bundle_package_ + "/Contents/PkgInfo"));

    output_ = root + "/out/InstallESD.dmg";
    ASSERT_THAT(EnsureDirectoryExists(root + "/out"), IsOk());
  }

  void TearDown() override {
    manager_.reset();
    workspace_.reset();
  }

  Result<void> Run(bool write_automated_config) {
    return Inject(*manager_, tool_, image_, {flat_package_, bundle_package_},
                  output_, write_automated_config);
  }

  android::base::TemporaryDir scratch_;
  FakeDiskImageTool tool_;
  std::unique_ptr<Workspace> workspace_;
  std::unique_ptr<VolumeManager> manager_;
  std::string image_;
  std::string volume_;
  std::string flat_package_;
  std::string bundle_package_;
  std::string output_;
};

TEST_F(InjectionTest, PackagesAndCollectionLandInConvertedImage) {
  ASSERT_THAT(Run(/* write_automated_config */ false), IsOk());

  std::string content;
  ASSERT_TRUE(android::base::ReadFileToString(output_, &content));
  EXPECT_EQ(content, "UDZO\n");
  const auto tree = tool_.ConvertedTree(output_);
  ASSERT_FALSE(tree.empty());
  EXPECT_TRUE(FileExists(tree + "/Packages/BaseSystemBinaries.pkg"));
  EXPECT_TRUE(FileExists(tree + "/Packages/Munki.pkg"));
  EXPECT_TRUE(FileExists(tree + "/Packages/Bootstrap.mpkg/Contents/PkgInfo"));
  EXPECT_FALSE(DirectoryExists(tree + "/Packages/Extras"));

  auto collection =
      ReadPackageManifestList(tree + "/Packages/OSInstall.collection");
  ASSERT_THAT(collection, IsOk());
  EXPECT_THAT(*collection,
              ElementsAre("/System/Installation/Packages/OSInstall.mpkg",
                          "/System/Installation/Packages/OSInstall.mpkg",
                          "/System/Installation/Packages/Munki.pkg",
                          "/System/Installation/Packages/Bootstrap.mpkg"));

  EXPECT_EQ(tool_.attached_volumes(), 0u);
  EXPECT_EQ(manager_->LiveMounts(), 0u);
}

TEST_F(InjectionTest, SourceImageIsNotModified) {
  ASSERT_THAT(Run(/* write_automated_config */ true), IsOk());

  EXPECT_FALSE(FileExists(volume_ + "/Packages/Munki.pkg"));
  EXPECT_FALSE(FileExists(volume_ + "/Packages/OSInstall.collection"));
  std::string content;
  ASSERT_TRUE(android::base::ReadFileToString(image_, &content));
  EXPECT_EQ(content, "udif");
}

TEST_F(InjectionTest, AutomatedInstallConfig) {
  ASSERT_THAT(Run(/* write_automated_config */ true), IsOk());

  const auto tree = tool_.ConvertedTree(output_);
  auto config =
      ParsePlistFile(tree + "/Packages/Extras/minstallconfig.xml");
  ASSERT_THAT(config, IsOk());
  EXPECT_EQ((*config)["InstallType"].asString(), "automated");
  EXPECT_EQ((*config)["Language"].asString(), "en");
  EXPECT_EQ((*config)["Package"].asString(),
            "/System/Installation/Packages/OSInstall.collection");
  EXPECT_EQ((*config)["Target"].asString(), "/Volumes/Macintosh HD");
}

TEST_F(InjectionTest, ExistingExtrasDirectoryIsReused) {
  ASSERT_THAT(EnsureDirectoryExists(volume_ + "/Packages/Extras"), IsOk());
  ASSERT_TRUE(android::base::WriteStringToFile(
      "keep", volume_ + "/Packages/Extras/custom.txt"));

  ASSERT_THAT(Run(/* write_automated_config */ true), IsOk());

  const auto tree = tool_.ConvertedTree(output_);
  EXPECT_TRUE(FileExists(tree + "/Packages/Extras/custom.txt"));
  EXPECT_TRUE(FileExists(tree + "/Packages/Extras/minstallconfig.xml"));
}

TEST_F(InjectionTest, MissingPackagesDirectory) {
  const auto bare = std::string(scratch_.path) + "/bare";
  ASSERT_THAT(EnsureDirectoryExists(bare), IsOk());
  tool_.AddImage(image_, {bare});

  EXPECT_THAT(Run(/* write_automated_config */ false),
              IsErrorAndMessage(HasSubstr("no Packages directory")));
  EXPECT_EQ(tool_.attached_volumes(), 0u);
  EXPECT_EQ(manager_->LiveMounts(), 0u);
  EXPECT_FALSE(FileExists(output_));
}

TEST_F(InjectionTest, CopyFailureReleasesMount) {
  auto result = Inject(*manager_, tool_, image_,
                       {std::string(scratch_.path) + "/Missing.pkg"}, output_,
                       /* write_automated_config */ false);

  EXPECT_THAT(result, IsErrorAndMessage(HasSubstr("Missing.pkg")));
  EXPECT_THAT(result, IsErrorAndMessage(HasSubstr("Package injection")));
  EXPECT_EQ(tool_.attached_volumes(), 0u);
  EXPECT_EQ(manager_->LiveMounts(), 0u);
  EXPECT_FALSE(FileExists(output_));
}

TEST_F(InjectionTest, PackageNamedLikeVendorManifestIsRejected) {
  const auto impostor = std::string(scratch_.path) + "/extra/OSInstall.mpkg";
  ASSERT_THAT(EnsureDirectoryExists(impostor + "/Contents"), IsOk());

  auto result = Inject(*manager_, tool_, image_, {impostor}, output_,
                       /* write_automated_config */ false);

  EXPECT_THAT(result, IsErrorAndMessage(HasSubstr("already holds")));
  EXPECT_EQ(tool_.attached_volumes(), 0u);
  EXPECT_EQ(manager_->LiveMounts(), 0u);
  EXPECT_FALSE(FileExists(output_));
  EXPECT_TRUE(tool_.ConvertedTree(output_).empty());
}

TEST_F(InjectionTest, DuplicatePackageNamesAreRejected) {
  const std::string root = scratch_.path;
  ASSERT_THAT(EnsureDirectoryExists(root + "/a"), IsOk());
  ASSERT_THAT(EnsureDirectoryExists(root + "/b"), IsOk());
  ASSERT_TRUE(android::base::WriteStringToFile("first", root + "/a/X.pkg"));
  ASSERT_TRUE(android::base::WriteStringToFile("second", root + "/b/X.pkg"));

  auto result = Inject(*manager_, tool_, image_,
                       {root + "/a/X.pkg", root + "/b/X.pkg"}, output_,
                       /* write_automated_config */ false);

  EXPECT_THAT(result, IsErrorAndMessage(HasSubstr("already holds X.pkg")));
  EXPECT_EQ(tool_.attached_volumes(), 0u);
  EXPECT_EQ(manager_->LiveMounts(), 0u);
  EXPECT_FALSE(FileExists(output_));
}

TEST_F(InjectionTest, ConvertFailure) {
  tool_.FailConvert(true);

  EXPECT_THAT(Run(/* write_automated_config */ false),
              IsErrorAndMessage(HasSubstr("convert failed")));
  EXPECT_EQ(tool_.attached_volumes(), 0u);
  EXPECT_EQ(manager_->LiveMounts(), 0u);
  EXPECT_FALSE(FileExists(output_));
}

TEST_F(InjectionTest, AttachFailure) {
  tool_.FailAttach(image_);

  EXPECT_THAT(Run(/* write_automated_config */ false),
              IsErrorAndMessage(HasSubstr("Failed to mount")));
  EXPECT_EQ(manager_->LiveMounts(), 0u);
}

}  // namespace
}  // namespace osinstall
