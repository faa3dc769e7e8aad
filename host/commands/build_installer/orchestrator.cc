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

#include "host/commands/build_installer/orchestrator.h"

#include <string>

#include <android-base/logging.h>

#include "common/libs/utils/files.h"
#include "host/libs/image/capacity.h"
#include "host/libs/installer/artifact_assembler.h"
#include "host/libs/installer/injection.h"
#include "host/libs/installer/manifest_extractor.h"
#include "host/libs/installer/source_installer.h"

namespace osinstall {
namespace {

struct SourceMetadata {
  VersionInfo version;
  ExpandedManifest manifest;
  ManifestFragments fragments;
};

void CheckInstallerOptions(const SourceInstaller& source,
                           const VersionInfo& version) {
  if (!source.installer_options) {
    return;
  }
  auto options = ExtractInstallerOptions(*source.installer_options);
  if (options.os_version && *options.os_version != version.product_version) {
    LOG(WARNING) << "Installer application claims version "
                 << *options.os_version << ", install image has "
                 << version.product_version;
  }
  if (options.os_build_version &&
      *options.os_build_version != version.build_number) {
    LOG(WARNING) << "Installer application claims build "
                 << *options.os_build_version << ", install image has "
                 << version.build_number;
  }
}

// An install image that attaches without any volume is not an installer.
Result<ScopedMount> MountInstallImage(VolumeManager& volume_manager,
                                      const std::string& image) {
  auto mount = volume_manager.MountScoped(image, /* use_shadow */ false);
  if (!mount.ok() && IsNothingMounted(mount.error())) {
    return StackTraceError(std::move(mount.error()))
        .PushEntry(OI_STACK_TRACE_ENTRY("")
                   << "\"" << image
                   << "\" has no volume, it is not an OS X install image");
  }
  return mount;
}

}  // namespace

std::string ToString(BuildState state) {
  switch (state) {
    case BuildState::kInit:
      return "Init";
    case BuildState::kSourceResolved:
      return "SourceResolved";
    case BuildState::kVersionRead:
      return "VersionRead";
    case BuildState::kManifestExpanded:
      return "ManifestExpanded";
    case BuildState::kCapacityChecked:
      return "CapacityChecked";
    case BuildState::kSkeletonBuilt:
      return "SkeletonBuilt";
    case BuildState::kMetadataWritten:
      return "MetadataWritten";
    case BuildState::kInjected:
      return "Injected";
    case BuildState::kCopied:
      return "Copied";
    case BuildState::kDone:
      return "Done";
    case BuildState::kFailed:
      return "Failed";
  }
  return "Unknown";
}

Orchestrator::Orchestrator(DiskImageTool& disk_image_tool,
                           PackageTool& package_tool)
    : disk_image_tool_(disk_image_tool), package_tool_(package_tool) {}

void Orchestrator::Transition(BuildState state) {
  LOG(DEBUG) << ToString(state_) << " -> " << ToString(state);
  state_ = state;
}

Result<std::string> Orchestrator::Build(const BuildOptions& options,
                                        bool keep_partial_output,
                                        const std::string& scratch_parent) {
  state_ = BuildState::kInit;
  auto workspace = Workspace::Create(scratch_parent, "osinstall.");
  if (!workspace.ok()) {
    Transition(BuildState::kFailed);
    return OI_ERR("Could not create a scratch workspace: "
                  << workspace.error().Message());
  }
  // Declared after the workspace so that it goes away first.
  VolumeManager volume_manager(disk_image_tool_, *workspace);
  auto output =
      RunPipeline(options, keep_partial_output, *workspace, volume_manager);
  if (!output.ok()) {
    Transition(BuildState::kFailed);
  }
  return output;
}

Result<std::string> Orchestrator::RunPipeline(const BuildOptions& options,
                                              bool keep_partial_output,
                                              const Workspace& workspace,
                                              VolumeManager& volume_manager) {
  auto source = OI_EXPECT(ResolveSourceInstaller(options.source));
  Transition(BuildState::kSourceResolved);
  if (!options.output.empty()) {
    OI_EXPECTF(!FileExists(options.output, /* follow_symlinks */ false),
               "\"{}\" already exists", options.output);
  }

  SourceMetadata metadata;
  {
    auto install_image =
        OI_EXPECT(MountInstallImage(volume_manager, source.install_image));
    metadata.version = OI_EXPECT(
        ReadInstallImageVersion(volume_manager, install_image.root()));
    Transition(BuildState::kVersionRead);
    CheckInstallerOptions(source, metadata.version);

    auto manifest = source.ManifestPath(install_image.root());
    if (source.kind == SourceKind::kDiskImage && DirectoryExists(manifest)) {
      // The install image is detached before the package is assembled.
      auto copy = workspace.PathFor(cpp_basename(manifest));
      OI_EXPECT(CopyDirectoryRecursively(manifest, copy));
      manifest = copy;
    }
    metadata.manifest =
        OI_EXPECT(ExpandManifest(package_tool_, workspace, manifest));
    metadata.fragments = ExtractManifestFragments(metadata.manifest.distribution);
    Transition(BuildState::kManifestExpanded);
  }

  const auto output =
      options.output.empty()
          ? DefaultOutputPath(CurrentDirectory(),
                              metadata.version.product_version,
                              metadata.version.build_number, options.disk_image)
          : options.output;
  OI_EXPECTF(!FileExists(output, /* follow_symlinks */ false),
             "\"{}\" already exists", output);

  if (!options.packages.empty()) {
    CapacityPlanner planner(volume_manager, disk_image_tool_);
    OI_EXPECT(planner.PlanCapacity(source.install_image, options.packages));
    Transition(BuildState::kCapacityChecked);
  }

  OutputArtifactGuard artifact(output, keep_partial_output);
  const auto identifier = options.identifier.empty()
                              ? std::string(kDefaultPackageIdentifier)
                              : options.identifier;
  if (options.disk_image) {
    OI_EXPECT(Inject(volume_manager, disk_image_tool_, source.install_image,
                     options.packages, output,
                     /* write_automated_config */ true));
    Transition(BuildState::kInjected);
  } else {
    OI_EXPECT(CreateBundleSkeleton(output));
    Transition(BuildState::kSkeletonBuilt);
    OI_EXPECT(WriteMetadata(output, metadata.version, identifier,
                            kDefaultInstalledSizeKB));
    OI_EXPECT(WriteEmptyPayload(package_tool_, workspace, output));
    OI_EXPECT(SynthesizeManifest(output, metadata.fragments, identifier,
                                 kDefaultInstalledSizeKB));
    CopyLocalizedResources(output, metadata.manifest.resources);
    OI_EXPECT(WritePostinstallScript(output));
    Transition(BuildState::kMetadataWritten);

    const auto image = SideLoadedImagePath(output);
    if (options.packages.empty()) {
      LOG(INFO) << "Copying " << source.install_image << " into the package";
      OI_EXPECT(Copy(source.install_image, image));
      Transition(BuildState::kCopied);
    } else {
      OI_EXPECT(Inject(volume_manager, disk_image_tool_, source.install_image,
                       options.packages, image,
                       /* write_automated_config */ false));
      Transition(BuildState::kInjected);
    }
  }

  artifact.Commit();
  Transition(BuildState::kDone);
  LOG(INFO) << "Built " << output;
  return output;
}

fruit::Component<fruit::Required<DiskImageTool, PackageTool>, Orchestrator>
OrchestratorComponent() {
  return fruit::createComponent();
}

}  // namespace osinstall
