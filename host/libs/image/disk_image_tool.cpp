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

#include "host/libs/image/disk_image_tool.h"

#include <errno.h>
#include <string.h>
#include <sys/statvfs.h>

#include <string>
#include <vector>

#include <android-base/logging.h>
#include <json/json.h>

#include "common/libs/utils/plist.h"
#include "common/libs/utils/subprocess.h"

namespace osinstall {
namespace {

constexpr char kHdiutil[] = "/usr/bin/hdiutil";

class HdiutilDiskImageTool : public DiskImageTool {
 public:
  INJECT(HdiutilDiskImageTool()) = default;

  Result<std::vector<std::string>> Attach(
      const std::string& image, const std::string& mount_root,
      const std::optional<std::string>& shadow) override {
    Command attach(kHdiutil);
    attach.AddParameter("attach")
        .AddParameter(image)
        .AddParameter("-mountrandom")
        .AddParameter(mount_root)
        .AddParameter("-nobrowse")
        .AddParameter("-noverify")
        .AddParameter("-noautoopen")
        .AddParameter("-owners")
        .AddParameter("on")
        .AddParameter("-plist");
    if (shadow) {
      attach.AddParameter("-shadow").AddParameter(*shadow);
    }
    auto output = OI_EXPECTF(RunAndCaptureStdout(std::move(attach)),
                             "Could not attach \"{}\"", image);
    return OI_EXPECTF(ParseAttachOutput(output),
                      "Unexpected output attaching \"{}\"", image);
  }

  Result<void> Detach(const std::string& mount_point, bool force) override {
    Command detach(kHdiutil);
    detach.AddParameter("detach").AddParameter(mount_point);
    if (force) {
      detach.AddParameter("-force");
    }
    OI_EXPECT(Execute(std::move(detach)));
    return {};
  }

  Result<void> ConvertCompressed(const std::string& image,
                                 const std::string& shadow,
                                 const std::string& destination) override {
    OI_EXPECT(Execute(Command(kHdiutil)
                          .AddParameter("convert")
                          .AddParameter(image)
                          .AddParameter("-format")
                          .AddParameter("UDZO")
                          .AddParameter("-o")
                          .AddParameter(destination)
                          .AddParameter("-shadow")
                          .AddParameter(shadow)));
    return {};
  }

  Result<uint64_t> AvailableBytes(const std::string& mount_point) override {
    struct statvfs stats {};
    if (statvfs(mount_point.c_str(), &stats) != 0) {
      return OI_ERRNO("statvfs(\"" << mount_point
                                   << "\") failed: " << strerror(errno));
    }
    return static_cast<uint64_t>(stats.f_bavail) *
           static_cast<uint64_t>(stats.f_frsize);
  }
};

}  // namespace

Result<std::vector<std::string>> ParseAttachOutput(const std::string& output) {
  // hdiutil may print progress or license text ahead of the property list.
  auto start = output.find("<?xml");
  OI_EXPECT(start != std::string::npos, "No property list in hdiutil output");
  auto plist = OI_EXPECT(ParsePlistString(output.substr(start)));
  OI_EXPECT(plist.isObject(), "hdiutil output is not a dictionary");

  std::vector<std::string> mount_points;
  const Json::Value& entities = plist["system-entities"];
  if (!entities.isArray()) {
    LOG(DEBUG) << "hdiutil output has no system-entities";
    return mount_points;
  }
  for (const auto& entity : entities) {
    if (entity.isObject() && entity["mount-point"].isString()) {
      mount_points.push_back(entity["mount-point"].asString());
    }
  }
  return mount_points;
}

fruit::Component<DiskImageTool> HdiutilDiskImageToolComponent() {
  return fruit::createComponent().bind<DiskImageTool, HdiutilDiskImageTool>();
}

}  // namespace osinstall
