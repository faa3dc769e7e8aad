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

#include "host/libs/image/capacity.h"

#include <fcntl.h>
#include <unistd.h>

#include <memory>
#include <string>
#include <vector>

#include <android-base/file.h>
#include <android-base/unique_fd.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result_matchers.h"
#include "common/libs/utils/workspace.h"
#include "host/libs/image/fake_disk_image_tool.h"

namespace osinstall {
namespace {

using ::testing::HasSubstr;

void WriteBytes(const std::string& path, size_t size) {
  ASSERT_TRUE(android::base::WriteStringToFile(std::string(size, 'x'), path));
}

TEST(SizeOfPathsTest, FilesAndDirectories) {
  android::base::TemporaryDir dir;
  const std::string flat = std::string(dir.path) + "/Flat.pkg";
  const std::string bundle = std::string(dir.path) + "/Bundle.pkg";
  WriteBytes(flat, 1000);
  ASSERT_THAT(EnsureDirectoryExists(bundle + "/Contents/Resources"), IsOk());
  WriteBytes(bundle + "/Contents/Archive.pax.gz", 2000);
  WriteBytes(bundle + "/Contents/Resources/Description.plist", 72);

  // 3072 bytes in total.
  EXPECT_EQ(SizeOfPathsKB({flat, bundle}), 3);
  EXPECT_EQ(SizeOfPathsKB({flat}), 1);
}

TEST(SizeOfPathsTest, RoundsUpAndIgnoresMissingPaths) {
  android::base::TemporaryDir dir;
  const std::string file = std::string(dir.path) + "/Small.pkg";
  WriteBytes(file, 1025);

  EXPECT_EQ(SizeOfPathsKB({file, std::string(dir.path) + "/Missing.pkg"}), 2);
  EXPECT_EQ(SizeOfPathsKB({}), 0);
}

TEST(SizeOfPathsTest, StableForUnchangedTree) {
  android::base::TemporaryDir dir;
  const std::string bundle = std::string(dir.path) + "/Bundle.mpkg";
  ASSERT_THAT(EnsureDirectoryExists(bundle + "/Contents/Packages"), IsOk());
  WriteBytes(bundle + "/Contents/Packages/A.pkg", 5000);
  WriteBytes(bundle + "/Contents/Packages/B.pkg", 7000);
  ASSERT_EQ(symlink("Packages/A.pkg", (bundle + "/Contents/Link").c_str()), 0);

  const auto first = SizeOfPathsKB({bundle});
  const auto second = SizeOfPathsKB({bundle});
  const auto third = SizeOfPathsKB({bundle});

  // 12000 bytes, the symlink is not followed.
  EXPECT_EQ(first, 12);
  EXPECT_EQ(second, first);
  EXPECT_EQ(third, first);
}

TEST(CheckCapacityTest, MarginIsRequired) {
  EXPECT_THAT(CheckCapacity({.total_package_size_kb = 900,
                             .available_space_kb = 1000}),
              IsOk());
  EXPECT_THAT(CheckCapacity({.total_package_size_kb = 901,
                             .available_space_kb = 1000}),
              IsErrorAndMessage(HasSubstr("Not enough space")));
  EXPECT_THAT(
      CheckCapacity({.total_package_size_kb = 0, .available_space_kb = 50}),
      IsError());
}

TEST(CheckCapacityTest, UnknownFreeSpaceIsFatal) {
  EXPECT_THAT(
      CheckCapacity({.total_package_size_kb = 0, .available_space_kb = -1}),
      IsErrorAndMessage(HasSubstr("Could not determine")));
}

class CapacityPlannerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto workspace = Workspace::Create(scratch_.path, "ws.");
    ASSERT_THAT(workspace, IsOk());
    workspace_ = std::make_unique<Workspace>(std::move(*workspace));
    image_ = std::string(scratch_.path) + "/InstallESD.dmg";
    ASSERT_TRUE(android::base::WriteStringToFile("udif", image_));
    const auto volume = std::string(scratch_.path) + "/volume";
    ASSERT_THAT(EnsureDirectoryExists(volume + "/Packages"), IsOk());
    tool_.AddImage(image_, {volume});
    manager_ = std::make_unique<VolumeManager>(tool_, *workspace_);
  }

  void TearDown() override {
    EXPECT_EQ(manager_->LiveMounts(), 0u);
    manager_.reset();
    workspace_.reset();
  }

  android::base::TemporaryDir scratch_;
  FakeDiskImageTool tool_;
  std::unique_ptr<Workspace> workspace_;
  std::unique_ptr<VolumeManager> manager_;
  std::string image_;
};

TEST_F(CapacityPlannerTest, AvailableSpace) {
  tool_.SetAvailableBytes(uint64_t{400000} * 1024);
  CapacityPlanner planner(*manager_, tool_);

  EXPECT_EQ(planner.AvailableSpaceKB(image_), 400000);
  EXPECT_EQ(tool_.attached_volumes(), 0u);
}

TEST_F(CapacityPlannerTest, AvailableSpaceUnknown) {
  CapacityPlanner planner(*manager_, tool_);

  tool_.SetAvailableBytes(std::nullopt);
  EXPECT_EQ(planner.AvailableSpaceKB(image_), -1);

  tool_.FailAttach(image_);
  EXPECT_EQ(planner.AvailableSpaceKB(image_), -1);
}

TEST_F(CapacityPlannerTest, PlanRejectsOversizedPackages) {
  // Sparse files, only their apparent size counts.
  std::vector<std::string> packages;
  for (const char* name : {"First.pkg", "Second.pkg"}) {
    auto path = std::string(scratch_.path) + "/" + name;
    android::base::unique_fd fd(
        open(path.c_str(), O_CREAT | O_WRONLY | O_CLOEXEC, 0644));
    ASSERT_GE(fd.get(), 0);
    ASSERT_EQ(ftruncate(fd.get(), off_t{250000} * 1024), 0);
    packages.push_back(path);
  }
  tool_.SetAvailableBytes(uint64_t{400000} * 1024);
  CapacityPlanner planner(*manager_, tool_);

  auto report = planner.PlanCapacity(image_, packages);

  EXPECT_THAT(report, IsErrorAndMessage(HasSubstr("500000 KB")));
}

TEST_F(CapacityPlannerTest, PlanAcceptsFittingPackages) {
  const auto package = std::string(scratch_.path) + "/Small.pkg";
  WriteBytes(package, 4096);
  tool_.SetAvailableBytes(uint64_t{1024} * 1024);
  CapacityPlanner planner(*manager_, tool_);

  auto report = planner.PlanCapacity(image_, {package});

  ASSERT_THAT(report, IsOk());
  EXPECT_EQ(report->total_package_size_kb, 4);
  EXPECT_EQ(report->available_space_kb, 1024);
}

}  // namespace
}  // namespace osinstall
