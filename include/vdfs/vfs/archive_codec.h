#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

#include "vdfs/vfs/node.h"

namespace vdfs::vfs {

// Archive generations the container format distinguishes.
enum class GameVersion : std::uint8_t { kGothic1 = 1, kGothic2 = 2 };

std::string_view GameVersionName(GameVersion version) noexcept;

// Parses "g1"/"g2" (case-insensitive). Throws InvalidGameVersionError otherwise.
GameVersion ParseGameVersion(std::string_view value);

// Encodes and decodes an on-disk archive into a node tree.
class ArchiveCodec {
public:
  virtual ~ArchiveCodec() = default;

  virtual std::string_view Name() const noexcept = 0;

  // True when this codec recognises the on-disk representation at path.
  virtual bool CanRead(const std::filesystem::path& archive) const = 0;

  // Populates root (an empty directory) from the archive at path.
  virtual void Read(const std::filesystem::path& archive, VfsNode& root) const = 0;

  // True when this codec can produce its representation at destination.
  virtual bool CanWrite(const std::filesystem::path& destination) const = 0;

  virtual void Write(const VfsNode& root, const std::filesystem::path& destination,
                     GameVersion version) const = 0;
};

// True when path is a regular file carrying the VDF container signature
// ("PSVDSC_V2.00" after the 256-byte comment block).
bool LooksLikeVdfContainer(const std::filesystem::path& path);

// Mirrors the tree below root into host directory dir, which is created.
void WriteHostTree(const VfsNode& root, const std::filesystem::path& dir);

// Unpacked archive: the archive is a host directory whose tree mirrors the
// node tree. Saving stages the tree beside the destination and swaps it in.
class DirectoryCodec : public ArchiveCodec {
public:
  std::string_view Name() const noexcept override { return "directory"; }
  bool CanRead(const std::filesystem::path& archive) const override;
  void Read(const std::filesystem::path& archive, VfsNode& root) const override;
  bool CanWrite(const std::filesystem::path& destination) const override;
  void Write(const VfsNode& root, const std::filesystem::path& destination,
             GameVersion version) const override;
};

// Codecs in preference order: the VDF container codec when it was built,
// then the directory codec.
std::vector<std::shared_ptr<const ArchiveCodec>> DefaultCodecs();

}  // namespace vdfs::vfs
