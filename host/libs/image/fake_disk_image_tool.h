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

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/libs/utils/result.h"
#include "host/libs/image/disk_image_tool.h"

namespace osinstall {

// Mounts "images" by copying registered directory trees below the mount
// root. Writes through a shadow file end up in `<shadow>.tree` on detach and
// ConvertCompressed registers that tree as the content of the new image.
class FakeDiskImageTool : public DiskImageTool {
 public:
  FakeDiskImageTool() = default;

  // `volumes` are directories whose content appears on the mounted volumes.
  // Images are looked up by full path first, then by basename.
  void AddImage(const std::string& image, std::vector<std::string> volumes);
  void FailAttach(const std::string& image) { failing_attach_.insert(image); }
  void FailConvert(bool fail) { fail_convert_ = fail; }
  // Number of upcoming polite detaches that fail.
  void FailPoliteDetaches(int count) { failing_polite_detaches_ = count; }
  void SetAvailableBytes(std::optional<uint64_t> bytes) {
    available_bytes_ = bytes;
  }

  Result<std::vector<std::string>> Attach(
      const std::string& image, const std::string& mount_root,
      const std::optional<std::string>& shadow) override;
  Result<void> Detach(const std::string& mount_point, bool force) override;
  Result<void> ConvertCompressed(const std::string& image,
                                 const std::string& shadow,
                                 const std::string& destination) override;
  Result<uint64_t> AvailableBytes(const std::string& mount_point) override;

  size_t attach_count() const { return attach_count_; }
  // Attaches that went through a shadow file, i.e. writable ones.
  size_t shadowed_attach_count() const { return shadowed_attach_count_; }
  size_t forced_detach_count() const { return forced_detach_count_; }
  size_t attached_volumes() const { return attached_.size(); }
  const std::vector<std::string>& attached_images() const {
    return attached_images_;
  }
  // Content of a converted image, empty if `destination` was never written.
  std::string ConvertedTree(const std::string& destination) const;

 private:
  struct Attachment {
    std::string image;
    std::optional<std::string> shadow;
  };

  const std::vector<std::string>* FindVolumes(const std::string& image) const;

  std::map<std::string, std::vector<std::string>> images_;
  std::set<std::string> failing_attach_;
  std::map<std::string, Attachment> attached_;
  std::map<std::string, std::string> converted_;
  std::vector<std::string> attached_images_;
  std::optional<uint64_t> available_bytes_ = uint64_t{64} << 30;
  bool fail_convert_ = false;
  int failing_polite_detaches_ = 0;
  size_t attach_count_ = 0;
  size_t shadowed_attach_count_ = 0;
  size_t forced_detach_count_ = 0;
};

}  // namespace osinstall
