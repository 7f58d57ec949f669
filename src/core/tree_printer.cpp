#include "vdfs/core/tree_printer.h"

#include <algorithm>
#include <cstddef>
#include <utility>

#include "vdfs/common.h"

namespace vdfs::core {
namespace {

constexpr const char* kBranch = "├── ";
constexpr const char* kLastBranch = "└── ";
constexpr const char* kPipe = "│   ";
constexpr const char* kBlank = "    ";

struct Level {
  std::vector<const vfs::VfsNode*> children;
  size_t next{0};
  std::string indent;
};

std::vector<const vfs::VfsNode*> SortedChildren(const vfs::VfsNode& node) {
  std::vector<const vfs::VfsNode*> out;
  out.reserve(node.Children().size());
  for (const auto& child : node.Children()) {
    out.push_back(child.get());
  }
  std::stable_sort(out.begin(), out.end(), [](const vfs::VfsNode* lhs, const vfs::VfsNode* rhs) {
    if (lhs->IsDirectory() != rhs->IsDirectory()) {
      return lhs->IsDirectory();
    }
    return lhs->Name() < rhs->Name();
  });
  return out;
}

}  // namespace

std::vector<TreeLine> TreePrinter::Lines(const vfs::VfsNode& node) {
  std::vector<TreeLine> lines;
  std::vector<Level> stack;
  stack.push_back(Level{SortedChildren(node), 0, {}});
  while (!stack.empty()) {
    auto& level = stack.back();
    if (level.next == level.children.size()) {
      stack.pop_back();
      continue;
    }
    const auto* child = level.children[level.next++];
    const bool last = level.next == level.children.size();

    TreeLine line;
    line.prefix = level.indent + (last ? kLastBranch : kBranch);
    line.is_directory = child->IsDirectory();
    line.label = line.is_directory ? "[" + TitleCase(child->Name()) + "]" : TitleCase(child->Name());
    lines.push_back(std::move(line));

    if (child->IsDirectory()) {
      // push_back may reallocate, so level is not used past this point.
      std::string indent = level.indent + (last ? kBlank : kPipe);
      stack.push_back(Level{SortedChildren(*child), 0, std::move(indent)});
    }
  }
  return lines;
}

std::string TreePrinter::Render(const vfs::VfsNode& node) {
  std::string out;
  for (const auto& line : Lines(node)) {
    out += line.prefix;
    out += line.label;
    out += '\n';
  }
  return out;
}

}  // namespace vdfs::core
