#include "vdfs/core/host_tree.h"

#include <algorithm>
#include <cerrno>
#include <string>
#include <system_error>

#include "vdfs/common.h"
#include "vdfs/error.h"
#include "vdfs/errors.h"

namespace vdfs::core {
namespace {

std::string EntryName(const std::filesystem::path& path) {
  auto name = path.filename();
  if (name.empty()) {
    name = path.parent_path().filename();
  }
  return PathToUtf8String(name);
}

// Fills dir.children with the direct entries of dir.path. The vector is final
// once this returns, so pointers to its elements stay valid.
void ReadLevel(HostTreeEntry& dir) {
  std::error_code ec;
  std::filesystem::directory_iterator it(dir.path, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, errors::io::kHostReadFailed,
                std::string(errors::msg::kHostReadFailed) + ": " + PathToUtf8String(dir.path),
                ec.value()};
  }
  for (const auto& item : it) {
    std::error_code type_ec;
    const auto status = item.symlink_status(type_ec);
    if (type_ec) {
      continue;
    }
    HostTreeEntry entry;
    entry.path = item.path();
    entry.name = EntryName(item.path());
    if (std::filesystem::is_directory(status)) {
      entry.is_directory = true;
    } else if (!std::filesystem::is_regular_file(status)) {
      continue;
    }
    dir.children.push_back(std::move(entry));
  }
  std::sort(dir.children.begin(), dir.children.end(),
            [](const HostTreeEntry& lhs, const HostTreeEntry& rhs) { return lhs.name < rhs.name; });
}

}  // namespace

size_t HostTreeEntry::FileCount() const {
  size_t files = 0;
  std::vector<const HostTreeEntry*> pending{this};
  while (!pending.empty()) {
    const auto* entry = pending.back();
    pending.pop_back();
    for (const auto& child : entry->children) {
      if (child.is_directory) {
        pending.push_back(&child);
      } else {
        ++files;
      }
    }
  }
  return files;
}

HostTreeEntry ReadHostTree(const std::filesystem::path& host_directory) {
  std::error_code ec;
  if (!std::filesystem::exists(host_directory, ec)) {
    throw Error{ErrorDomain::IO, errors::io::kHostPathMissing,
                std::string(errors::msg::kHostPathMissing) + PathToUtf8String(host_directory)};
  }
  if (!std::filesystem::is_directory(host_directory, ec)) {
    throw Error{ErrorDomain::IO, errors::io::kHostPathMissing,
                std::string(errors::msg::kHostNotDirectory) + PathToUtf8String(host_directory),
                ENOTDIR};
  }

  HostTreeEntry root;
  root.path = host_directory;
  const auto normalized = std::filesystem::absolute(host_directory, ec).lexically_normal();
  root.name = EntryName(ec ? host_directory : normalized);
  root.is_directory = true;

  std::vector<HostTreeEntry*> pending{&root};
  while (!pending.empty()) {
    auto* dir = pending.back();
    pending.pop_back();
    ReadLevel(*dir);
    for (auto& child : dir->children) {
      if (child.is_directory) {
        pending.push_back(&child);
      }
    }
  }
  return root;
}

}  // namespace vdfs::core
