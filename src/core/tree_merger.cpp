#include "vdfs/core/tree_merger.h"

#include <string>
#include <system_error>
#include <utility>

#include "vdfs/common.h"
#include "vdfs/error.h"
#include "vdfs/errors.h"
#include "vdfs/orchestrator/event_bus.h"
#include "vdfs/orchestrator/io_util.h"

namespace vdfs::core {

using orchestrator::EventCategory;
using orchestrator::EventField;
using orchestrator::EventSeverity;

std::string ApplyNameCase(std::string_view name, NameCase name_case, NameRole role) {
  switch (name_case) {
  case NameCase::kUpper:
    return ToUpper(name);
  case NameCase::kPreserve:
    return std::string(name);
  case NameCase::kArchive:
    break;
  }
  return role == NameRole::kInsertedFile ? ToUpper(name) : std::string(name);
}

bool IsRootInternalPath(std::string_view internal_path) {
  return internal_path.empty() || internal_path == "." || internal_path == "/" ||
         internal_path == "\\" || internal_path == "./" || internal_path == ".\\";
}

TreeMerger::TreeMerger(vfs::VfsNode& root, NameCase name_case)
    : root_(&root), resolver_(root), name_case_(name_case) {}

std::vector<std::string> TreeMerger::CasedSegments(std::string_view internal_path) const {
  auto segments = SplitInternalPath(internal_path);
  for (auto& segment : segments) {
    segment = ApplyNameCase(segment, name_case_, NameRole::kDirectorySegment);
  }
  return segments;
}

vfs::VfsNode& TreeMerger::Merge(const HostTreeEntry& description, vfs::VfsNode* target) const {
  vfs::VfsNode* parent = target ? target : root_;
  auto& top = resolver_.EnsureDirectory(
      {ApplyNameCase(description.name, name_case_, NameRole::kMergedEntry)}, parent);

  size_t files = 0;
  std::vector<std::pair<const HostTreeEntry*, vfs::VfsNode*>> pending{{&description, &top}};
  while (!pending.empty()) {
    auto [entry, node] = pending.back();
    pending.pop_back();
    for (const auto& child : entry->children) {
      const auto name = ApplyNameCase(child.name, name_case_, NameRole::kMergedEntry);
      if (child.is_directory) {
        auto& dir = resolver_.EnsureDirectory(std::vector<std::string>{name}, node);
        pending.emplace_back(&child, &dir);
      } else {
        node->CreateFile(name, orchestrator::ReadHostFile(child.path));
        ++files;
      }
    }
  }
  orchestrator::PublishEvent(EventCategory::kDiagnostics, EventSeverity::kDebug, "merger.merge",
                             "Merged host directory",
                             {EventField("source", PathToUtf8String(description.path),
                                         orchestrator::FieldPrivacy::kHash),
                              EventField("files", std::to_string(files), orchestrator::FieldPrivacy::kPublic,
                                         true)});
  return top;
}

vfs::VfsNode& TreeMerger::MergeHostDirectory(const std::filesystem::path& host_directory,
                                             vfs::VfsNode* target) const {
  return Merge(ReadHostTree(host_directory), target);
}

vfs::VfsNode& TreeMerger::InsertHostFile(const std::filesystem::path& host_file,
                                         vfs::VfsNode* target) const {
  vfs::VfsNode* parent = target ? target : root_;
  auto name = ApplyNameCase(PathToUtf8String(host_file.filename()), name_case_,
                            NameRole::kInsertedFile);
  return parent->CreateFile(std::move(name), orchestrator::ReadHostFile(host_file));
}

vfs::VfsNode* TreeMerger::InsertFile(const std::optional<std::string>& internal_path,
                                     const std::optional<std::filesystem::path>& source_path,
                                     const std::optional<std::vector<uint8_t>>& content) const {
  if (!source_path || source_path->empty()) {
    if (!internal_path || IsRootInternalPath(*internal_path)) {
      throw InvalidDataError(std::string(errors::msg::kNoSourceOrInternalPath));
    }
    auto segments = SplitInternalPath(*internal_path);
    if (segments.empty()) {
      throw InvalidDataError(std::string(errors::msg::kNoSourceOrInternalPath));
    }
    if (segments.back().find('.') == std::string::npos) {
      return &resolver_.EnsureDirectory(CasedSegments(*internal_path));
    }
    if (!content) {
      throw InvalidDataError(std::string(errors::msg::kNoSourceOrContent));
    }
    auto file_name = ApplyNameCase(segments.back(), name_case_, NameRole::kInsertedFile);
    segments.pop_back();
    for (auto& segment : segments) {
      segment = ApplyNameCase(segment, name_case_, NameRole::kDirectorySegment);
    }
    auto& parent = resolver_.EnsureDirectory(segments);
    return &parent.CreateFile(std::move(file_name), *content);
  }

  std::error_code ec;
  if (!std::filesystem::exists(*source_path, ec)) {
    throw Error{ErrorDomain::IO, errors::io::kHostPathMissing,
                std::string(errors::msg::kHostPathMissing) + PathToUtf8String(*source_path)};
  }
  vfs::VfsNode* target = root_;
  if (internal_path && !IsRootInternalPath(*internal_path)) {
    target = &resolver_.EnsureDirectory(CasedSegments(*internal_path));
  }
  if (std::filesystem::is_directory(*source_path, ec)) {
    return &MergeHostDirectory(*source_path, target);
  }
  return &InsertHostFile(*source_path, target);
}

}  // namespace vdfs::core
