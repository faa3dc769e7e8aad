/*
 * Copyright (C) 2024 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "common/libs/utils/files.h"

#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <libgen.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/macros.h>
#include <android-base/unique_fd.h>

#include "common/libs/utils/result.h"

namespace osinstall {

bool FileExists(const std::string& path, bool follow_symlinks) {
  struct stat st {};
  return (follow_symlinks ? stat : lstat)(path.c_str(), &st) == 0;
}

bool FileHasContent(const std::string& path) {
  return FileSize(path) > 0;
}

Result<std::vector<std::string>> DirectoryContents(const std::string& path) {
  std::vector<std::string> ret;
  std::unique_ptr<DIR, int (*)(DIR*)> dir(opendir(path.c_str()), closedir);
  OI_EXPECTF(dir != nullptr, "Could not read from dir \"{}\"", path);
  struct dirent* ent{};
  while ((ent = readdir(dir.get()))) {
    std::string name = ent->d_name;
    if (name == "." || name == "..") {
      continue;
    }
    ret.emplace_back(std::move(name));
  }
  return ret;
}

bool DirectoryExists(const std::string& path, bool follow_symlinks) {
  struct stat st {};
  if ((follow_symlinks ? stat : lstat)(path.c_str(), &st) == -1) {
    return false;
  }
  if ((st.st_mode & S_IFMT) != S_IFDIR) {
    return false;
  }
  return true;
}

Result<void> EnsureDirectoryExists(const std::string& directory_path,
                                   const mode_t mode) {
  if (DirectoryExists(directory_path, /* follow_symlinks */ true)) {
    return {};
  }
  const auto parent_dir = cpp_dirname(directory_path);
  if (parent_dir.size() > 1 && parent_dir != directory_path) {
    OI_EXPECT(EnsureDirectoryExists(parent_dir, mode));
  }
  LOG(VERBOSE) << "Setting up " << directory_path;
  if (mkdir(directory_path.c_str(), mode) < 0 && errno != EEXIST) {
    return OI_ERRNO("Failed to create directory: \"" << directory_path << "\" "
                                                     << strerror(errno));
  }
  return {};
}

Result<void> RecursivelyRemoveDirectory(const std::string& path) {
  // Copied from libbase TemporaryDir destructor.
  auto callback = [](const char* child, const struct stat*, int file_type,
                     struct FTW*) -> int {
    switch (file_type) {
      case FTW_D:
      case FTW_DP:
      case FTW_DNR:
        if (rmdir(child) == -1) {
          PLOG(ERROR) << "rmdir " << child;
        }
        break;
      case FTW_NS:
      default:
        if (rmdir(child) != -1) {
          break;
        }
        // FALLTHRU (for gcc, lint, pcc, etc; and following for clang)
        FALLTHROUGH_INTENDED;
      case FTW_F:
      case FTW_SL:
      case FTW_SLN:
        if (unlink(child) == -1) {
          PLOG(ERROR) << "unlink " << child;
        }
        break;
    }
    return 0;
  };

  if (nftw(path.c_str(), callback, 128, FTW_DEPTH | FTW_MOUNT | FTW_PHYS) !=
      0) {
    return OI_ERRNO("nftw(\"" << path << "\") failed: " << strerror(errno));
  }
  OI_EXPECTF(!FileExists(path, /* follow_symlinks */ false),
             "\"{}\" still exists after removal", path);
  return {};
}

Result<void> Copy(const std::string& from, const std::string& to) {
  struct stat st {};
  if (stat(from.c_str(), &st) != 0) {
    return OI_ERRNO("stat(\"" << from << "\") failed: " << strerror(errno));
  }
  android::base::unique_fd fd_from(open(from.c_str(), O_RDONLY | O_CLOEXEC));
  if (fd_from.get() < 0) {
    return OI_ERRNO("Could not open \"" << from << "\": " << strerror(errno));
  }
  android::base::unique_fd fd_to(
      open(to.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
           st.st_mode & 07777));
  if (fd_to.get() < 0) {
    return OI_ERRNO("Could not open \"" << to << "\": " << strerror(errno));
  }

  std::array<char, 1 << 16> buffer;
  while (true) {
    auto bytes_read =
        TEMP_FAILURE_RETRY(read(fd_from.get(), buffer.data(), buffer.size()));
    if (bytes_read < 0) {
      return OI_ERRNO("read from \"" << from << "\" failed: "
                                     << strerror(errno));
    }
    if (bytes_read == 0) {
      break;
    }
    OI_EXPECTF(android::base::WriteFully(fd_to.get(), buffer.data(),
                                         static_cast<size_t>(bytes_read)),
               "write to \"{}\" failed: {}", to, strerror(errno));
  }
  if (fchmod(fd_to.get(), st.st_mode & 07777) != 0) {
    PLOG(WARNING) << "Could not preserve the mode of \"" << to << "\"";
  }
  return {};
}

Result<void> CopyDirectoryRecursively(const std::string& from,
                                      const std::string& to) {
  OI_EXPECTF(DirectoryExists(from, /* follow_symlinks */ false),
             "\"{}\" is not a directory", from);
  OI_EXPECTF(!FileExists(to, /* follow_symlinks */ false),
             "Refusing to copy over existing \"{}\"", to);

  struct stat st {};
  if (stat(from.c_str(), &st) != 0) {
    return OI_ERRNO("stat(\"" << from << "\") failed: " << strerror(errno));
  }
  if (mkdir(to.c_str(), st.st_mode & 07777) != 0) {
    return OI_ERRNO("mkdir(\"" << to << "\") failed: " << strerror(errno));
  }

  for (const auto& name : OI_EXPECT(DirectoryContents(from))) {
    const auto src = from + "/" + name;
    const auto dst = to + "/" + name;
    struct stat child {};
    if (lstat(src.c_str(), &child) != 0) {
      return OI_ERRNO("lstat(\"" << src << "\") failed: " << strerror(errno));
    }
    if (S_ISLNK(child.st_mode)) {
      std::string target;
      OI_EXPECTF(android::base::Readlink(src, &target),
                 "readlink(\"{}\") failed", src);
      if (symlink(target.c_str(), dst.c_str()) != 0) {
        return OI_ERRNO("symlink(\"" << target << "\", \"" << dst
                                     << "\") failed: " << strerror(errno));
      }
    } else if (S_ISDIR(child.st_mode)) {
      OI_EXPECT(CopyDirectoryRecursively(src, dst));
    } else if (S_ISREG(child.st_mode)) {
      OI_EXPECT(Copy(src, dst));
    } else {
      LOG(WARNING) << "Skipping special file \"" << src << "\"";
    }
  }
  return {};
}

Result<void> MakeFileExecutable(const std::string& path) {
  LOG(DEBUG) << "Making " << path << " executable";
  if (chmod(path.c_str(), S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH) !=
      0) {
    return OI_ERRNO("chmod(\"" << path << "\") failed: " << strerror(errno));
  }
  return {};
}

std::string AbsolutePath(const std::string& path) {
  if (path.empty()) {
    return {};
  }
  if (path[0] == '/') {
    return path;
  }
  if (path[0] == '~') {
    LOG(WARNING) << "Tilde expansion in path " << path <<" is not supported";
    return {};
  }

  std::array<char, PATH_MAX> buffer{};
  if (!realpath(".", buffer.data())) {
    LOG(WARNING) << "Could not get real path for current directory \".\""
                 << ": " << strerror(errno);
    return {};
  }
  return std::string{buffer.data()} + "/" + path;
}

off_t FileSize(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) == -1) {
    return 0;
  }
  return st.st_size;
}

bool RemoveFile(const std::string& file) {
  LOG(DEBUG) << "Removing file " << file;
  if (remove(file.c_str()) == 0) {
    return true;
  }
  LOG(ERROR) << "Failed to remove file " << file << " : "
             << std::strerror(errno);
  return false;
}

std::string CurrentDirectory() {
  std::unique_ptr<char, void (*)(void*)> cwd(getcwd(nullptr, 0), &free);
  if (!cwd) {
    PLOG(ERROR) << "`getcwd(nullptr, 0)` failed";
    return "";
  }
  return std::string(cwd.get());
}

std::string cpp_basename(const std::string& str) {
  char* copy = strdup(str.c_str());  // basename may modify its argument
  std::string ret(basename(copy));
  free(copy);
  return ret;
}

std::string cpp_dirname(const std::string& str) {
  char* copy = strdup(str.c_str());  // dirname may modify its argument
  std::string ret(dirname(copy));
  free(copy);
  return ret;
}

}  // namespace osinstall
