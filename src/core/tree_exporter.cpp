#include "vdfs/core/tree_exporter.h"

#include <exception>
#include <string>
#include <utility>
#include <vector>

#include "vdfs/common.h"
#include "vdfs/error.h"
#include "vdfs/errors.h"
#include "vdfs/orchestrator/event_bus.h"
#include "vdfs/orchestrator/io_util.h"

namespace vdfs::core {

using orchestrator::EventCategory;
using orchestrator::EventField;
using orchestrator::EventSeverity;
using orchestrator::FieldPrivacy;

std::filesystem::path ResolveDestination(const std::filesystem::path& destination) {
  if (!destination.empty()) {
    return destination;
  }
  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);
  if (ec) {
    throw Error{ErrorDomain::IO, errors::io::kHostPathMissing,
                std::string(errors::msg::kHostPathMissing) + ".", ec.value()};
  }
  return cwd;
}

void TreeExporter::WriteFile(const vfs::VfsNode& file, const std::filesystem::path& destination) {
  orchestrator::AtomicReplace(destination / file.Name(), file.Data());
}

size_t TreeExporter::WriteSubtree(const vfs::VfsNode& directory,
                                  const std::filesystem::path& destination) {
  size_t files = 0;
  std::vector<std::pair<const vfs::VfsNode*, std::filesystem::path>> pending;
  pending.emplace_back(&directory, destination);
  while (!pending.empty()) {
    auto [node, host_dir] = std::move(pending.back());
    pending.pop_back();
    orchestrator::EnsureHostDirectory(host_dir);
    const auto& children = node->Children();
    // Files of this level first, then subdirectories in creation order.
    for (const auto& child : children) {
      if (!child->IsDirectory()) {
        WriteFile(*child, host_dir);
        ++files;
      }
    }
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
      if ((*it)->IsDirectory()) {
        pending.emplace_back(it->get(), host_dir / (*it)->Name());
      }
    }
  }
  return files;
}

size_t TreeExporter::WriteMatching(std::string_view filter,
                                   const std::filesystem::path& destination) const {
  size_t files = 0;
  std::vector<const vfs::VfsNode*> pending;
  const auto push_children = [&pending](const vfs::VfsNode& dir) {
    for (auto it = dir.Children().rbegin(); it != dir.Children().rend(); ++it) {
      pending.push_back(it->get());
    }
  };
  push_children(vfs_->Root());
  while (!pending.empty()) {
    const auto* node = pending.back();
    pending.pop_back();
    if (node->IsDirectory()) {
      push_children(*node);
    } else if (ContainsInsensitive(node->Name(), filter)) {
      WriteFile(*node, destination);
      ++files;
    }
  }
  return files;
}

OperationReport TreeExporter::ExportNode(std::string_view name,
                                         const std::filesystem::path& destination,
                                         bool match_all) const {
  const vfs::VfsNode* node = nullptr;
  if (!match_all) {
    node = vfs_->Find(name);
    if (!node) {
      throw NodeNotFoundError(std::string(name) + std::string(errors::msg::kNodeNotFoundSuffix));
    }
  }
  const auto target = ResolveDestination(destination);
  orchestrator::PublishEvent(EventCategory::kDiagnostics, EventSeverity::kInfo, "exporter.export_node",
                             "Exporting",
                             {EventField("name", std::string(name)),
                              EventField("destination", PathToUtf8String(target), FieldPrivacy::kHash),
                              EventField("wildcard", match_all ? "true" : "false")});
  OperationReport report;
  try {
    orchestrator::EnsureHostDirectory(target);
    if (match_all) {
      report.files = WriteMatching(name, target);
    } else if (node->IsDirectory()) {
      report.files = WriteSubtree(*node, target);
    } else {
      WriteFile(*node, target);
      report.files = 1;
    }
  } catch (const std::exception& ex) {
    report.ok = false;
    report.error = ex.what();
    orchestrator::PublishEvent(EventCategory::kDiagnostics, EventSeverity::kError,
                               "exporter.export_node", "Failed to export",
                               {EventField("name", std::string(name)),
                                EventField("error", report.error)});
    return report;
  }
  orchestrator::PublishEvent(EventCategory::kDiagnostics, EventSeverity::kInfo, "exporter.export_node",
                             "Exported",
                             {EventField("files", std::to_string(report.files), FieldPrivacy::kPublic,
                                         true)});
  return report;
}

OperationReport TreeExporter::ExportAll(const std::filesystem::path& destination) const {
  OperationReport report;
  try {
    const auto target = ResolveDestination(destination);
    orchestrator::PublishEvent(EventCategory::kDiagnostics, EventSeverity::kInfo,
                               "exporter.export_all", "Exporting all files",
                               {EventField("destination", PathToUtf8String(target),
                                           FieldPrivacy::kHash)});
    report.files = WriteSubtree(vfs_->Root(), target);
  } catch (const std::exception& ex) {
    report.ok = false;
    report.error = ex.what();
    orchestrator::PublishEvent(EventCategory::kDiagnostics, EventSeverity::kError,
                               "exporter.export_all",
                               "Failed to export all files due to an unhandled exception",
                               {EventField("error", report.error)});
  }
  return report;
}

}  // namespace vdfs::core
