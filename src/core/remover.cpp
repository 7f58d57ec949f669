#include "vdfs/core/remover.h"

#include <exception>
#include <string>
#include <vector>

#include "vdfs/common.h"
#include "vdfs/error.h"
#include "vdfs/errors.h"
#include "vdfs/orchestrator/event_bus.h"

namespace vdfs::core {

using orchestrator::EventCategory;
using orchestrator::EventField;
using orchestrator::EventSeverity;
using orchestrator::FieldPrivacy;

namespace {

size_t FilesBelow(const vfs::VfsNode& node) {
  if (!node.IsDirectory()) {
    return 1;
  }
  size_t files = 0;
  std::vector<const vfs::VfsNode*> pending{&node};
  while (!pending.empty()) {
    const auto* dir = pending.back();
    pending.pop_back();
    for (const auto& child : dir->Children()) {
      if (child->IsDirectory()) {
        pending.push_back(child.get());
      } else {
        ++files;
      }
    }
  }
  return files;
}

}  // namespace

OperationReport Remover::Remove(std::string_view name, vfs::VfsNode* start_parent,
                                bool match_all) const {
  if (!match_all && !vfs_->Find(name)) {
    throw NodeNotFoundError(std::string(name) + std::string(errors::msg::kNodeNotFoundSuffix));
  }
  orchestrator::PublishEvent(EventCategory::kDiagnostics, EventSeverity::kInfo, "remover.remove",
                             "Removing", {EventField("name", std::string(name)),
                                          EventField("wildcard", match_all ? "true" : "false")});

  OperationReport report;
  try {
    std::vector<vfs::VfsNode*> pending{start_parent ? start_parent : &vfs_->Root()};
    while (!pending.empty()) {
      auto* dir = pending.back();
      pending.pop_back();

      std::vector<const vfs::VfsNode*> doomed;
      std::vector<vfs::VfsNode*> descend;
      for (const auto& child : dir->Children()) {
        if (child->IsDirectory()) {
          if (!match_all && EqualsInsensitive(child->Name(), name)) {
            doomed.push_back(child.get());
          } else {
            descend.push_back(child.get());
          }
        } else if (match_all ? ContainsInsensitive(child->Name(), name)
                             : EqualsInsensitive(child->Name(), name)) {
          doomed.push_back(child.get());
        }
      }
      for (const auto* node : doomed) {
        const size_t files = FilesBelow(*node);
        if (dir->RemoveChild(node)) {
          report.files += files;
        }
      }
      for (auto it = descend.rbegin(); it != descend.rend(); ++it) {
        pending.push_back(*it);
      }
    }
  } catch (const std::exception& ex) {
    report.ok = false;
    report.error = ex.what();
    orchestrator::PublishEvent(EventCategory::kDiagnostics, EventSeverity::kError, "remover.remove",
                               "Failed to remove due to an unhandled exception",
                               {EventField("name", std::string(name)),
                                EventField("error", report.error)});
    return report;
  }
  orchestrator::PublishEvent(EventCategory::kDiagnostics, EventSeverity::kInfo, "remover.remove",
                             "Successfully removed",
                             {EventField("name", std::string(name)),
                              EventField("files", std::to_string(report.files),
                                         FieldPrivacy::kPublic, true)});
  return report;
}

}  // namespace vdfs::core
