#include "vdfs/vfs/zenkit_codec.h"

#include <exception>
#include <memory>
#include <span>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <zenkit/Misc.hh>
#include <zenkit/Stream.hh>
#include <zenkit/Vfs.hh>

#include "vdfs/common.h"
#include "vdfs/error.h"
#include "vdfs/errors.h"
#include "vdfs/orchestrator/event_bus.h"
#include "vdfs/orchestrator/io_util.h"

namespace vdfs::vfs {
namespace {

using orchestrator::EventCategory;
using orchestrator::EventField;
using orchestrator::EventSeverity;
using orchestrator::FieldPrivacy;

zenkit::GameVersion ToZenKit(GameVersion version) noexcept {
  return version == GameVersion::kGothic1 ? zenkit::GameVersion::GOTHIC_1
                                          : zenkit::GameVersion::GOTHIC_2;
}

std::vector<uint8_t> ReadPayload(const zenkit::VfsNode& file, const std::filesystem::path& archive) {
  auto reader = file.open_read();
  reader->seek(0, zenkit::Whence::END);
  const auto size = reader->tell();
  reader->seek(0, zenkit::Whence::BEG);
  std::vector<uint8_t> data(size);
  if (size != 0 && reader->read(data.data(), size) != size) {
    throw Error{ErrorDomain::IO, errors::io::kArchiveUnreadable,
                std::string(errors::msg::kArchiveUnreadable) + PathToUtf8String(archive) +
                    ": short read of " + file.name()};
  }
  return data;
}

}  // namespace

bool ZenKitCodec::CanRead(const std::filesystem::path& archive) const {
  return LooksLikeVdfContainer(archive);
}

bool ZenKitCodec::CanWrite(const std::filesystem::path& destination) const {
  std::error_code ec;
  return !std::filesystem::is_directory(destination, ec);
}

void ZenKitCodec::Read(const std::filesystem::path& archive, VfsNode& root) const {
  zenkit::Vfs disk;
  try {
    disk.mount_disk(archive, zenkit::VfsOverwriteBehavior::ALL);
  } catch (const std::exception& ex) {
    throw Error{ErrorDomain::IO, errors::io::kArchiveUnreadable,
                std::string(errors::msg::kArchiveUnreadable) + PathToUtf8String(archive) + ": " +
                    ex.what()};
  }

  std::vector<std::pair<const zenkit::VfsNode*, VfsNode*>> pending{{&disk.root(), &root}};
  while (!pending.empty()) {
    auto [source, target] = pending.back();
    pending.pop_back();
    for (const auto& child : source->children()) {
      if (child.type() == zenkit::VfsNodeType::DIRECTORY) {
        pending.emplace_back(&child, &target->CreateDirectory(child.name()));
      } else {
        target->CreateFile(child.name(), ReadPayload(child, archive));
      }
    }
  }
  orchestrator::PublishEvent(EventCategory::kStorage, EventSeverity::kDebug, "codec.zenkit.read",
                             "VDF container read",
                             {EventField("archive", PathToUtf8String(archive), FieldPrivacy::kHash)});
}

void ZenKitCodec::Write(const VfsNode& root, const std::filesystem::path& destination,
                        GameVersion version) const {
  // zenkit::Vfs packs host trees, so the node tree is staged on disk first.
  const auto staged = orchestrator::MakeSiblingPath(destination, "staging");
  std::vector<std::byte> packed;
  try {
    WriteHostTree(root, staged);
    zenkit::Vfs container;
    container.mount_host(staged, "/", zenkit::VfsOverwriteBehavior::ALL);
    auto writer = zenkit::Write::to(&packed);
    container.save(writer.get(), ToZenKit(version));
  } catch (const Error&) {
    std::error_code ec;
    std::filesystem::remove_all(staged, ec);
    throw;
  } catch (const std::exception& ex) {
    std::error_code ec;
    std::filesystem::remove_all(staged, ec);
    throw Error{ErrorDomain::IO, errors::io::kArchiveWriteFailed,
                std::string(errors::msg::kArchiveWriteFailed) + PathToUtf8String(destination) +
                    ": " + ex.what()};
  }
  std::error_code ec;
  std::filesystem::remove_all(staged, ec);

  if (destination.has_parent_path()) {
    orchestrator::EnsureHostDirectory(destination.parent_path());
  }
  orchestrator::AtomicReplace(
      destination,
      std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(packed.data()), packed.size()));
  orchestrator::PublishEvent(EventCategory::kStorage, EventSeverity::kDebug, "codec.zenkit.write",
                             "VDF container written",
                             {EventField("destination", PathToUtf8String(destination),
                                         FieldPrivacy::kHash),
                              EventField("version", std::string(GameVersionName(version))),
                              EventField("bytes", std::to_string(packed.size()),
                                         FieldPrivacy::kPublic, true)});
}

}  // namespace vdfs::vfs
