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

#include "host/libs/installer/package_tool.h"

#include <string>

#include "common/libs/utils/files.h"
#include "common/libs/utils/subprocess.h"

namespace osinstall {
namespace {

class SystemPackageTool : public PackageTool {
 public:
  INJECT(SystemPackageTool()) = default;

  Result<void> Expand(const std::string& package,
                      const std::string& destination) override {
    OI_EXPECTF(!FileExists(destination, /* follow_symlinks */ false),
               "Cannot expand into existing \"{}\"", destination);
    OI_EXPECTF(Execute(Command("/usr/sbin/pkgutil")
                           .AddParameter("--expand")
                           .AddParameter(package)
                           .AddParameter(destination)),
               "Could not expand \"{}\"", package);
    return {};
  }

  Result<void> CreatePayloadArchive(const std::string& directory,
                                    const std::string& archive) override {
    OI_EXPECT(Execute(Command("/bin/pax")
                          .AddParameter("-w")
                          .AddParameter("-x")
                          .AddParameter("cpio")
                          .AddParameter("-z")
                          .AddParameter("-f")
                          .AddParameter(archive)
                          .AddParameter(".")
                          .SetWorkingDirectory(directory)));
    return {};
  }

  Result<void> CreateBom(const std::string& directory,
                         const std::string& bom) override {
    OI_EXPECT(Execute(Command("/usr/bin/mkbom")
                          .AddParameter(directory)
                          .AddParameter(bom)));
    return {};
  }
};

}  // namespace

fruit::Component<PackageTool> SystemPackageToolComponent() {
  return fruit::createComponent().bind<PackageTool, SystemPackageTool>();
}

}  // namespace osinstall
