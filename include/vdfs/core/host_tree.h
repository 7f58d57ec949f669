#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace vdfs::core {

// Structural mirror of a host directory. A directory entry carries its
// children; a file entry only references the host path.
struct HostTreeEntry {
  std::string name;
  std::filesystem::path path;
  bool is_directory{false};
  std::vector<HostTreeEntry> children;

  size_t FileCount() const;
};

// Walks host_directory and returns an entry named after the directory itself.
// Entries within a directory are ordered by name. Symlinks and special files are
// skipped. Throws Error{IO} if host_directory is missing or not a directory.
HostTreeEntry ReadHostTree(const std::filesystem::path& host_directory);

}  // namespace vdfs::core
