#pragma once

// Editable archive node. Directories keep their children in creation order;
// the container layout is read and written by an ArchiveCodec.

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vdfs::vfs {

class VfsNode {
public:
  using ChildList = std::vector<std::unique_ptr<VfsNode>>;

  static std::unique_ptr<VfsNode> MakeDirectory(std::string name);
  static std::unique_ptr<VfsNode> MakeFile(std::string name, std::vector<uint8_t> data);

  VfsNode(const VfsNode&) = delete;
  VfsNode& operator=(const VfsNode&) = delete;

  const std::string& Name() const noexcept { return name_; }
  bool IsDirectory() const noexcept { return is_directory_; }
  VfsNode* Parent() const noexcept { return parent_; }

  // Payload of a file node; empty for directories.
  std::span<const uint8_t> Data() const noexcept { return data_; }

  // Children in creation order.
  const ChildList& Children() const noexcept { return children_; }

  // Case-insensitive lookup among direct children. Returns the first match.
  VfsNode* GetChild(std::string_view name) const noexcept;

  // Appends a new directory child. Throws NameCollisionError when a file with
  // the same name already sits in this directory.
  VfsNode& CreateDirectory(std::string name);

  // Appends a new file child. Same-named files are not replaced; a same-named
  // directory raises NameCollisionError.
  VfsNode& CreateFile(std::string name, std::vector<uint8_t> data);

  // Removes the first child matching name (case-insensitive).
  bool Remove(std::string_view name);

  // Removes exactly this child. Returns false if it is not a child of this node.
  bool RemoveChild(const VfsNode* child);

private:
  VfsNode(std::string name, bool is_directory, std::vector<uint8_t> data);
  void RequireDirectory() const;
  void ValidateName(std::string_view name) const;

  std::string name_;
  bool is_directory_{false};
  std::vector<uint8_t> data_;
  VfsNode* parent_{nullptr};
  ChildList children_;
};

}  // namespace vdfs::vfs
