#include "vdfs/vfs/node.h"

#include <algorithm>
#include <string>
#include <utility>

#include "vdfs/common.h"
#include "vdfs/error.h"
#include "vdfs/errors.h"

namespace vdfs::vfs {

std::unique_ptr<VfsNode> VfsNode::MakeDirectory(std::string name) {
  return std::unique_ptr<VfsNode>(new VfsNode(std::move(name), true, {}));
}

std::unique_ptr<VfsNode> VfsNode::MakeFile(std::string name, std::vector<uint8_t> data) {
  return std::unique_ptr<VfsNode>(new VfsNode(std::move(name), false, std::move(data)));
}

VfsNode::VfsNode(std::string name, bool is_directory, std::vector<uint8_t> data)
    : name_(std::move(name)), is_directory_(is_directory), data_(std::move(data)) {}

void VfsNode::RequireDirectory() const {
  if (!is_directory_) {
    throw Error{ErrorDomain::Vfs, errors::vfs::kNotADirectory,
                "Node is not a directory: " + name_};
  }
}

void VfsNode::ValidateName(std::string_view name) const {
  if (name.empty()) {
    throw Error{ErrorDomain::Vfs, errors::vfs::kInvalidNodeName,
                std::string(errors::msg::kEmptyNodeName)};
  }
  if (name.find('/') != std::string_view::npos || name.find('\\') != std::string_view::npos) {
    throw Error{ErrorDomain::Vfs, errors::vfs::kInvalidNodeName,
                "Node name must not contain path separators: " + std::string(name)};
  }
  if (name == "." || name == "..") {
    throw Error{ErrorDomain::Vfs, errors::vfs::kInvalidNodeName,
                std::string(errors::msg::kRelativeNodeName) + std::string(name)};
  }
}

VfsNode* VfsNode::GetChild(std::string_view name) const noexcept {
  for (const auto& child : children_) {
    if (EqualsInsensitive(child->name_, name)) {
      return child.get();
    }
  }
  return nullptr;
}

VfsNode& VfsNode::CreateDirectory(std::string name) {
  RequireDirectory();
  ValidateName(name);
  for (const auto& child : children_) {
    if (!child->is_directory_ && EqualsInsensitive(child->name_, name)) {
      throw NameCollisionError(std::string(errors::msg::kSegmentIsFile) + name);
    }
  }
  auto node = MakeDirectory(std::move(name));
  node->parent_ = this;
  children_.push_back(std::move(node));
  return *children_.back();
}

VfsNode& VfsNode::CreateFile(std::string name, std::vector<uint8_t> data) {
  RequireDirectory();
  ValidateName(name);
  for (const auto& child : children_) {
    if (child->is_directory_ && EqualsInsensitive(child->name_, name)) {
      throw NameCollisionError(std::string(errors::msg::kFileShadowsDirectory) + name);
    }
  }
  auto node = MakeFile(std::move(name), std::move(data));
  node->parent_ = this;
  children_.push_back(std::move(node));
  return *children_.back();
}

bool VfsNode::Remove(std::string_view name) {
  auto it = std::find_if(children_.begin(), children_.end(), [&](const auto& child) {
    return EqualsInsensitive(child->name_, name);
  });
  if (it == children_.end()) {
    return false;
  }
  children_.erase(it);
  return true;
}

bool VfsNode::RemoveChild(const VfsNode* child) {
  auto it = std::find_if(children_.begin(), children_.end(),
                         [child](const auto& candidate) { return candidate.get() == child; });
  if (it == children_.end()) {
    return false;
  }
  children_.erase(it);
  return true;
}

}  // namespace vdfs::vfs
