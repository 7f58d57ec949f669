#pragma once

#include <string_view>

#include "vdfs/core/operation_report.h"
#include "vdfs/vfs/node.h"
#include "vdfs/vfs/vfs.h"

namespace vdfs::core {

class Remover {
public:
  explicit Remover(vfs::Vfs& vfs) : vfs_(&vfs) {}

  // Exact mode: name must exist somewhere (NodeNotFoundError otherwise). Every
  // node below start_parent whose name equals name is removed, directories
  // with their contents; the scan does not stop at the first match.
  // Wildcard mode: every file whose name contains name is removed, directories
  // are only descended.
  // Traversal failures are reported, removals already done are kept.
  OperationReport Remove(std::string_view name, vfs::VfsNode* start_parent = nullptr,
                         bool match_all = false) const;

private:
  vfs::Vfs* vfs_;
};

}  // namespace vdfs::core
