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

#pragma once

#include <string>

#include <fruit/fruit.h>

#include "common/libs/utils/result.h"
#include "common/libs/utils/workspace.h"
#include "host/libs/config/build_config.h"
#include "host/libs/image/disk_image_tool.h"
#include "host/libs/image/volume_manager.h"
#include "host/libs/installer/package_tool.h"

namespace osinstall {

enum class BuildState {
  kInit,
  kSourceResolved,
  kVersionRead,
  kManifestExpanded,
  kCapacityChecked,
  kSkeletonBuilt,
  kMetadataWritten,
  kInjected,
  kCopied,
  kDone,
  kFailed,
};

std::string ToString(BuildState state);

class Orchestrator {
 public:
  INJECT(Orchestrator(DiskImageTool& disk_image_tool,
                      PackageTool& package_tool));

  // Runs one build with its scratch workspace below `scratch_parent` and
  // returns the path of the finished artifact. On failure nothing is left
  // mounted and the partial artifact is removed unless
  // `keep_partial_output`.
  Result<std::string> Build(const BuildOptions& options,
                            bool keep_partial_output,
                            const std::string& scratch_parent);

  BuildState state() const { return state_; }

 private:
  Result<std::string> RunPipeline(const BuildOptions& options,
                                  bool keep_partial_output,
                                  const Workspace& workspace,
                                  VolumeManager& volume_manager);
  void Transition(BuildState state);

  DiskImageTool& disk_image_tool_;
  PackageTool& package_tool_;
  BuildState state_ = BuildState::kInit;
};

fruit::Component<fruit::Required<DiskImageTool, PackageTool>, Orchestrator>
OrchestratorComponent();

}  // namespace osinstall
