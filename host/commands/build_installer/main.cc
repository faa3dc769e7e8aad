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

#include <stdlib.h>

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <android-base/logging.h>
#include <android-base/strings.h>
#include <fruit/fruit.h>
#include <gflags/gflags.h>

#include "common/libs/utils/result.h"
#include "common/libs/utils/tee_logging.h"
#include "host/commands/build_installer/orchestrator.h"
#include "host/libs/config/build_config.h"
#include "host/libs/image/disk_image_tool.h"
#include "host/libs/installer/artifact_assembler.h"
#include "host/libs/installer/package_tool.h"

DEFINE_string(source, "",
              "Install OS X application or InstallESD.dmg to build from. The "
              "first positional argument is used when not set.");
DEFINE_string(output, "",
              "Path of the artifact to create. Defaults to "
              "InstallOSX_<version>_<build>.pkg (or .dmg) in the current "
              "directory.");
DEFINE_string(packages, "",
              "Comma separated list of additional packages to install. "
              "Positional arguments after the source are appended.");
DEFINE_string(identifier, osinstall::kDefaultPackageIdentifier,
              "Package identifier of the generated installer package.");
DEFINE_bool(disk_image, false,
            "Create a compressed disk image with an automated install "
            "configuration instead of an installer package.");
DEFINE_string(config, "",
              "Configuration file with the keys source, output, packages, "
              "identifier and disk_image. Files ending in .json are read as "
              "JSON, others as property lists. Flags given on the command "
              "line take precedence.");
DEFINE_bool(debug, false, "Keep the partial output when the build fails.");
DEFINE_string(log_file, "", "Also append the full log to this file.");

namespace osinstall {
namespace {

constexpr char kUsage[] =
    "Builds an unattended OS X installer.\n\n"
    "  build_installer [flags] <Install OS X.app|InstallESD.dmg> "
    "[package.pkg ...]";

bool IsDefault(const char* name) {
  return gflags::GetCommandLineFlagInfoOrDie(name).is_default;
}

Result<BuildOptions> OptionsFromCommandLine(
    const std::vector<std::string>& positional) {
  BuildOptions options;
  std::vector<std::string> explicit_flags;
  for (const char* name :
       {"source", "output", "packages", "identifier", "disk_image"}) {
    if (!IsDefault(name)) {
      explicit_flags.push_back(name);
    }
  }

  options.source = FLAGS_source;
  options.output = FLAGS_output;
  options.identifier = FLAGS_identifier;
  options.disk_image = FLAGS_disk_image;
  for (const auto& package : android::base::Split(FLAGS_packages, ",")) {
    if (!package.empty()) {
      options.packages.push_back(package);
    }
  }

  auto next = positional.begin();
  if (options.source.empty() && next != positional.end()) {
    options.source = *next++;
    explicit_flags.push_back("source");
  }
  if (next != positional.end()) {
    options.packages.insert(options.packages.end(), next, positional.end());
    explicit_flags.push_back("packages");
  }

  if (!FLAGS_config.empty()) {
    auto config = OI_EXPECT(LoadConfigFile(FLAGS_config));
    ApplyConfigFile(config, explicit_flags, &options);
  }
  return OI_EXPECT(NormalizeBuildOptions(std::move(options)));
}

std::string ScratchParent() {
  const char* tmpdir = getenv("TMPDIR");
  return (tmpdir != nullptr && *tmpdir != '\0') ? tmpdir : "/tmp";
}

fruit::Component<Orchestrator> BuildInstallerComponent() {
  return fruit::createComponent()
      .install(HdiutilDiskImageToolComponent)
      .install(SystemPackageToolComponent)
      .install(OrchestratorComponent);
}

Result<int> BuildInstallerMain(int argc, char** argv) {
  ::android::base::InitLogging(argv, android::base::StderrLogger);
  gflags::SetUsageMessage(kUsage);
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  std::vector<std::string> log_files;
  if (!FLAGS_log_file.empty()) {
    log_files.push_back(FLAGS_log_file);
  }
  android::base::SetLogger(OI_EXPECT(LogToStderrAndFiles(log_files)));

  std::vector<std::string> positional(argv + 1, argv + argc);
  auto options = OI_EXPECT(OptionsFromCommandLine(positional));

  fruit::Injector<Orchestrator> injector(BuildInstallerComponent);
  Orchestrator& orchestrator = injector.get<Orchestrator&>();
  auto output = OI_EXPECT(
      orchestrator.Build(options, FLAGS_debug, ScratchParent()));
  std::cout << output << std::endl;
  return 0;
}

}  // namespace
}  // namespace osinstall

int main(int argc, char** argv) {
  auto res = osinstall::BuildInstallerMain(argc, argv);
  if (res.ok()) {
    return *res;
  }
  if (osinstall::ConsoleSeverity() <= android::base::DEBUG) {
    LOG(ERROR) << "build_installer failed: \n" << res.error().Trace();
  } else {
    LOG(ERROR) << "build_installer failed: \n" << res.error().Message();
  }
  return 1;
}
