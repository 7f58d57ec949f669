#pragma once

#include <filesystem>
#include <string_view>

#include "vdfs/vfs/archive_codec.h"

namespace vdfs::vfs {

// Packed VDF container read and written through ZenKit (zenkit::Vfs).
// Built only when ZenKit is found; DefaultCodecs() lists it first then.
class ZenKitCodec : public ArchiveCodec {
public:
  std::string_view Name() const noexcept override { return "zenkit"; }
  bool CanRead(const std::filesystem::path& archive) const override;
  void Read(const std::filesystem::path& archive, VfsNode& root) const override;
  // Anything but an existing directory.
  bool CanWrite(const std::filesystem::path& destination) const override;
  void Write(const VfsNode& root, const std::filesystem::path& destination,
             GameVersion version) const override;
};

}  // namespace vdfs::vfs
