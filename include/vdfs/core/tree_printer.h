#pragma once

#include <string>
#include <vector>

#include "vdfs/vfs/node.h"

namespace vdfs::core {

// One rendered row: connector prefix plus the display label, kept apart so the
// console can color the label by kind.
struct TreeLine {
  std::string prefix;
  std::string label;
  bool is_directory{false};
};

// Read-only tree view. Siblings are listed directories first, then by name;
// labels are title-cased and directories are wrapped in brackets.
class TreePrinter {
public:
  static std::vector<TreeLine> Lines(const vfs::VfsNode& node);

  // Lines joined with '\n', each line terminated.
  static std::string Render(const vfs::VfsNode& node);
};

}  // namespace vdfs::core
