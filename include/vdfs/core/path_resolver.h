#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "vdfs/vfs/node.h"

namespace vdfs::core {

// Resolves internal directory paths relative to a known directory, creating
// missing segments. Lookups are scoped to the directory being descended, so a
// same-named directory elsewhere in the tree never captures the path.
class PathResolver {
public:
  explicit PathResolver(vfs::VfsNode& root) : root_(&root) {}

  // Returns the directory named by segments below start (root when null).
  // An empty segment list returns start itself. Throws NameCollisionError when
  // a segment exists as a file.
  vfs::VfsNode& EnsureDirectory(const std::vector<std::string>& segments,
                                vfs::VfsNode* start = nullptr) const;

  // Splits path on '/' and '\' before resolving.
  vfs::VfsNode& EnsurePath(std::string_view path, vfs::VfsNode* start = nullptr) const;

  // Path-scoped lookup without creation. Returns null if any segment is missing.
  vfs::VfsNode* Resolve(const std::vector<std::string>& segments,
                        vfs::VfsNode* start = nullptr) const;

private:
  vfs::VfsNode* root_;
};

}  // namespace vdfs::core
