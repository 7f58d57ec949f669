#include "vdfs/vfs/vfs.h"

#include <string>
#include <utility>

#include "vdfs/common.h"
#include "vdfs/error.h"
#include "vdfs/errors.h"
#include "vdfs/orchestrator/event_bus.h"
#if defined(VDFS_HAVE_ZENKIT) && VDFS_HAVE_ZENKIT
#include "vdfs/vfs/zenkit_codec.h"
#endif

namespace vdfs::vfs {

using orchestrator::EventCategory;
using orchestrator::EventField;
using orchestrator::EventSeverity;

std::vector<std::shared_ptr<const ArchiveCodec>> DefaultCodecs() {
  std::vector<std::shared_ptr<const ArchiveCodec>> codecs;
#if defined(VDFS_HAVE_ZENKIT) && VDFS_HAVE_ZENKIT
  codecs.push_back(std::make_shared<const ZenKitCodec>());
#endif
  codecs.push_back(std::make_shared<const DirectoryCodec>());
  return codecs;
}

Vfs::Vfs() : Vfs(DefaultCodecs()) {}

Vfs::Vfs(std::vector<std::shared_ptr<const ArchiveCodec>> codecs)
    : root_(VfsNode::MakeDirectory("")), codecs_(std::move(codecs)) {}

VfsNode* Vfs::Find(std::string_view name) const {
  std::vector<VfsNode*> pending;
  for (auto it = root_->Children().rbegin(); it != root_->Children().rend(); ++it) {
    pending.push_back(it->get());
  }
  while (!pending.empty()) {
    VfsNode* node = pending.back();
    pending.pop_back();
    if (EqualsInsensitive(node->Name(), name)) {
      return node;
    }
    for (auto it = node->Children().rbegin(); it != node->Children().rend(); ++it) {
      pending.push_back(it->get());
    }
  }
  return nullptr;
}

size_t Vfs::CountFiles() const {
  size_t files = 0;
  std::vector<const VfsNode*> pending{root_.get()};
  while (!pending.empty()) {
    const VfsNode* node = pending.back();
    pending.pop_back();
    for (const auto& child : node->Children()) {
      if (child->IsDirectory()) {
        pending.push_back(child.get());
      } else {
        ++files;
      }
    }
  }
  return files;
}

const ArchiveCodec& Vfs::CodecFor(const std::filesystem::path& archive) const {
  for (const auto& codec : codecs_) {
    if (codec && codec->CanRead(archive)) {
      return *codec;
    }
  }
  if (LooksLikeVdfContainer(archive)) {
    throw Error{ErrorDomain::Dependency, errors::dependency::kCodecUnavailable,
                std::string(errors::msg::kContainerCodecMissing) + PathToUtf8String(archive)};
  }
  throw Error{ErrorDomain::Dependency, errors::dependency::kCodecUnavailable,
              std::string(errors::msg::kCodecUnavailable) + PathToUtf8String(archive)};
}

const ArchiveCodec& Vfs::WriterFor(const std::filesystem::path& destination) const {
  for (const auto& codec : codecs_) {
    if (codec && codec->CanWrite(destination)) {
      return *codec;
    }
  }
  throw Error{ErrorDomain::Dependency, errors::dependency::kCodecUnavailable,
              std::string(errors::msg::kCodecCannotWrite) + PathToUtf8String(destination)};
}

void Vfs::Mount(const std::filesystem::path& archive) {
  std::error_code ec;
  if (!std::filesystem::exists(archive, ec)) {
    throw Error{ErrorDomain::IO, errors::io::kArchiveMissing,
                std::string(errors::msg::kArchiveMissing) + PathToUtf8String(archive),
                ec ? std::optional<int>(ec.value()) : std::nullopt};
  }
  const auto& codec = CodecFor(archive);
  orchestrator::PublishEvent(EventCategory::kStorage, EventSeverity::kDebug, "vfs.mount",
                             "Mounting archive",
                             {EventField("archive", PathToUtf8String(archive),
                                         orchestrator::FieldPrivacy::kHash),
                              EventField("codec", std::string(codec.Name()))});
  auto fresh = VfsNode::MakeDirectory("");
  codec.Read(archive, *fresh);
  root_ = std::move(fresh);
  orchestrator::PublishEvent(EventCategory::kStorage, EventSeverity::kDebug, "vfs.mounted",
                             "Archive mounted",
                             {EventField("files", std::to_string(CountFiles()),
                                         orchestrator::FieldPrivacy::kPublic, true)});
}

void Vfs::Save(const std::filesystem::path& destination, GameVersion version) const {
  const auto& codec = WriterFor(destination);
  orchestrator::PublishEvent(EventCategory::kStorage, EventSeverity::kDebug, "vfs.save",
                             "Writing archive",
                             {EventField("destination", PathToUtf8String(destination),
                                         orchestrator::FieldPrivacy::kHash),
                              EventField("codec", std::string(codec.Name())),
                              EventField("version", std::string(GameVersionName(version)))});
  codec.Write(*root_, destination, version);
}

}  // namespace vdfs::vfs
