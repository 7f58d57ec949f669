#include "vdfs/vfs/archive_codec.h"

#include <algorithm>
#include <array>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

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

constexpr size_t kVdfCommentSize = 256;
constexpr std::string_view kVdfSignature{"PSVDSC_V2.00"};

std::vector<std::filesystem::directory_entry> SortedEntries(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, errors::io::kHostReadFailed,
                std::string(errors::msg::kHostReadFailed) + ": " + PathToUtf8String(dir), ec.value()};
  }
  std::vector<std::filesystem::directory_entry> entries;
  for (const auto& entry : it) {
    entries.push_back(entry);
  }
  std::sort(entries.begin(), entries.end(), [](const auto& lhs, const auto& rhs) {
    return lhs.path().filename() < rhs.path().filename();
  });
  return entries;
}

}  // namespace

std::string_view GameVersionName(GameVersion version) noexcept {
  switch (version) {
  case GameVersion::kGothic1:
    return "gothic1";
  case GameVersion::kGothic2:
    return "gothic2";
  }
  return "gothic2";
}

GameVersion ParseGameVersion(std::string_view value) {
  const auto lowered = ToLower(value);
  if (lowered == "g1") {
    return GameVersion::kGothic1;
  }
  if (lowered == "g2") {
    return GameVersion::kGothic2;
  }
  throw InvalidGameVersionError(std::string(errors::msg::kInvalidGameVersion) + std::string(value));
}

bool DirectoryCodec::CanRead(const std::filesystem::path& archive) const {
  std::error_code ec;
  return std::filesystem::is_directory(archive, ec);
}

void DirectoryCodec::Read(const std::filesystem::path& archive, VfsNode& root) const {
  std::vector<std::pair<std::filesystem::path, VfsNode*>> pending{{archive, &root}};
  while (!pending.empty()) {
    auto [dir, node] = pending.back();
    pending.pop_back();
    for (const auto& entry : SortedEntries(dir)) {
      const auto name = PathToUtf8String(entry.path().filename());
      std::error_code ec;
      if (entry.is_directory(ec)) {
        pending.emplace_back(entry.path(), &node->CreateDirectory(name));
      } else if (entry.is_regular_file(ec)) {
        node->CreateFile(name, orchestrator::ReadHostFile(entry.path()));
      } else {
        orchestrator::PublishEvent(EventCategory::kStorage, EventSeverity::kWarning,
                                   "codec.directory.skip", "Skipping non-regular host entry",
                                   {EventField("path", PathToUtf8String(entry.path()),
                                               orchestrator::FieldPrivacy::kHash)});
      }
    }
  }
}

void WriteHostTree(const VfsNode& root, const std::filesystem::path& dir) {
  orchestrator::EnsureHostDirectory(dir);
  std::vector<std::pair<const VfsNode*, std::filesystem::path>> pending{{&root, dir}};
  while (!pending.empty()) {
    auto [node, host_dir] = pending.back();
    pending.pop_back();
    for (const auto& child : node->Children()) {
      const auto target = host_dir / child->Name();
      if (child->IsDirectory()) {
        orchestrator::EnsureHostDirectory(target);
        pending.emplace_back(child.get(), target);
      } else {
        orchestrator::AtomicReplace(target, child->Data());
      }
    }
  }
}

bool LooksLikeVdfContainer(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return false;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  std::array<char, kVdfCommentSize + kVdfSignature.size()> head{};
  in.read(head.data(), static_cast<std::streamsize>(head.size()));
  if (in.gcount() != static_cast<std::streamsize>(head.size())) {
    return false;
  }
  return std::string_view(head.data() + kVdfCommentSize, kVdfSignature.size()) == kVdfSignature;
}

bool DirectoryCodec::CanWrite(const std::filesystem::path& destination) const {
  std::error_code ec;
  return !std::filesystem::exists(destination, ec) || std::filesystem::is_directory(destination, ec);
}

void DirectoryCodec::Write(const VfsNode& root, const std::filesystem::path& destination,
                           GameVersion version) const {
  auto staged = orchestrator::MakeSiblingPath(destination, "staging");
  try {
    WriteHostTree(root, staged);
    orchestrator::ReplaceDirectory(staged, destination);
  } catch (...) {
    std::error_code ec;
    std::filesystem::remove_all(staged, ec);
    throw;
  }
  orchestrator::PublishEvent(EventCategory::kStorage, EventSeverity::kDebug, "codec.directory.write",
                             "Unpacked archive written",
                             {EventField("destination", PathToUtf8String(destination),
                                         orchestrator::FieldPrivacy::kHash),
                              EventField("version", std::string(GameVersionName(version)))});
}

}  // namespace vdfs::vfs
