#pragma once

#include <cstddef>
#include <filesystem>
#include <string_view>

#include "vdfs/core/operation_report.h"
#include "vdfs/vfs/node.h"
#include "vdfs/vfs/vfs.h"

namespace vdfs::core {

// Writes archive nodes back to the host filesystem. A destination that does
// not exist is created; an empty destination means the working directory.
class TreeExporter {
public:
  explicit TreeExporter(const vfs::Vfs& vfs) : vfs_(&vfs) {}

  // match_all == false: global lookup of name. A directory has its contents
  // written below destination with their structure, a file is written
  // directly into destination. Throws NodeNotFoundError before any write.
  // match_all == true: every file whose name contains name is written flat
  // into destination. No match is not an error.
  OperationReport ExportNode(std::string_view name, const std::filesystem::path& destination,
                             bool match_all = false) const;

  // Writes the whole tree below destination. Failures are reported, files
  // written before the failure stay in place.
  OperationReport ExportAll(const std::filesystem::path& destination) const;

  // Writes the children of directory below destination, recreating subdirectories.
  static size_t WriteSubtree(const vfs::VfsNode& directory, const std::filesystem::path& destination);

  static void WriteFile(const vfs::VfsNode& file, const std::filesystem::path& destination);

private:
  size_t WriteMatching(std::string_view filter, const std::filesystem::path& destination) const;

  const vfs::Vfs* vfs_;
};

// Empty destination resolves to the current working directory.
std::filesystem::path ResolveDestination(const std::filesystem::path& destination);

}  // namespace vdfs::core
