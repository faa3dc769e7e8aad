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

#include <stdint.h>

#include <string>

#include "common/libs/utils/result.h"
#include "common/libs/utils/workspace.h"
#include "common/libs/utils/xml.h"
#include "host/libs/installer/manifest_extractor.h"
#include "host/libs/installer/package_tool.h"

namespace osinstall {

inline constexpr char kDefaultPackageIdentifier[] =
    "com.googlecode.munki.installosx";
inline constexpr int64_t kDefaultInstalledSizeKB = 8388608;

// Marketing name of the OS release `version` belongs to, or `version` itself
// for releases not in the table.
std::string OsDisplayName(const std::string& version);

// Removes a partially written output artifact, file or directory tree, unless
// the build committed it.
class OutputArtifactGuard {
 public:
  OutputArtifactGuard(std::string path, bool keep_on_failure);
  OutputArtifactGuard(const OutputArtifactGuard&) = delete;
  OutputArtifactGuard& operator=(const OutputArtifactGuard&) = delete;
  ~OutputArtifactGuard();

  void Commit() { committed_ = true; }
  const std::string& path() const { return path_; }

 private:
  std::string path_;
  bool keep_on_failure_;
  bool committed_ = false;
};

// Lays out an empty bundle style installer package at `path`, which must not
// exist yet.
Result<void> CreateBundleSkeleton(const std::string& path);

Result<void> WriteMetadata(const std::string& path, const VersionInfo& version,
                           const std::string& package_id,
                           int64_t installed_size_kb);

// The package installs nothing by itself, its payload archive and bill of
// materials describe the same empty directory.
Result<void> WriteEmptyPayload(PackageTool& package_tool,
                               const Workspace& workspace,
                               const std::string& path);

Result<XmlDocPtr> BuildDistribution(const ManifestFragments& fragments,
                                    const std::string& package_id,
                                    int64_t installed_size_kb);
Result<void> SynthesizeManifest(const std::string& path,
                                const ManifestFragments& fragments,
                                const std::string& package_id,
                                int64_t installed_size_kb);

// Copies the *.lproj directories of the vendor manifest. Failures are logged
// and skipped.
void CopyLocalizedResources(const std::string& path,
                            const std::string& resources);

Result<void> WritePostinstallScript(const std::string& path);

// Where the install image is placed inside the package.
std::string SideLoadedImagePath(const std::string& path);

}  // namespace osinstall
