#include "vdfs/core/path_resolver.h"

#include "vdfs/common.h"
#include "vdfs/error.h"
#include "vdfs/errors.h"
#include "vdfs/orchestrator/event_bus.h"

namespace vdfs::core {

using orchestrator::EventCategory;
using orchestrator::EventField;
using orchestrator::EventSeverity;

vfs::VfsNode& PathResolver::EnsureDirectory(const std::vector<std::string>& segments,
                                            vfs::VfsNode* start) const {
  vfs::VfsNode* current = start ? start : root_;
  if (!current->IsDirectory()) {
    throw Error{ErrorDomain::Vfs, errors::vfs::kNotADirectory,
                "Resolution must start at a directory: " + current->Name()};
  }
  for (const auto& segment : segments) {
    if (auto* existing = current->GetChild(segment)) {
      if (!existing->IsDirectory()) {
        throw NameCollisionError(std::string(errors::msg::kSegmentIsFile) + segment);
      }
      current = existing;
      continue;
    }
    current = &current->CreateDirectory(segment);
    orchestrator::PublishEvent(EventCategory::kDiagnostics, EventSeverity::kDebug,
                               "resolver.create_directory", "Created directory",
                               {EventField("name", segment)});
  }
  return *current;
}

vfs::VfsNode& PathResolver::EnsurePath(std::string_view path, vfs::VfsNode* start) const {
  return EnsureDirectory(SplitInternalPath(path), start);
}

vfs::VfsNode* PathResolver::Resolve(const std::vector<std::string>& segments,
                                    vfs::VfsNode* start) const {
  vfs::VfsNode* current = start ? start : root_;
  for (const auto& segment : segments) {
    auto* next = current->GetChild(segment);
    if (!next) {
      return nullptr;
    }
    current = next;
  }
  return current;
}

}  // namespace vdfs::core
