#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

#include "vdfs/vfs/archive_codec.h"
#include "vdfs/vfs/node.h"

namespace vdfs::vfs {

// Owns the node tree of one archive and the codecs that load and persist it.
class Vfs {
  std::unique_ptr<VfsNode> root_;
  std::vector<std::shared_ptr<const ArchiveCodec>> codecs_;

public:
  Vfs();
  explicit Vfs(std::vector<std::shared_ptr<const ArchiveCodec>> codecs);

  VfsNode& Root() noexcept { return *root_; }
  const VfsNode& Root() const noexcept { return *root_; }

  // Global lookup: first node in pre-order whose name matches (case-insensitive).
  // The root itself is never returned.
  VfsNode* Find(std::string_view name) const;

  // Replaces the tree with the contents of the archive at path.
  void Mount(const std::filesystem::path& archive);

  // Writes the tree with the first registered codec that can write destination.
  void Save(const std::filesystem::path& destination, GameVersion version) const;

  // Number of file nodes reachable from root.
  size_t CountFiles() const;

private:
  const ArchiveCodec& CodecFor(const std::filesystem::path& archive) const;
  const ArchiveCodec& WriterFor(const std::filesystem::path& destination) const;
};

}  // namespace vdfs::vfs
