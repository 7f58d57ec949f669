#include "vdfs/orchestrator/archive_handler.h"

#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

#include "vdfs/common.h"
#include "vdfs/core/path_resolver.h"
#include "vdfs/core/remover.h"
#include "vdfs/core/tree_exporter.h"
#include "vdfs/core/tree_printer.h"
#include "vdfs/error.h"
#include "vdfs/errors.h"
#include "vdfs/orchestrator/console.h"
#include "vdfs/orchestrator/event_bus.h"

namespace vdfs::orchestrator {

namespace {

bool PathExists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

} // namespace

ArchiveHandler::ArchiveHandler(std::optional<std::filesystem::path> archive, HandlerOptions options)
    : options_(options) {
  SetDebugging(options_.debugging, options_.full_debugging);
  if (archive && !archive->empty() && PathExists(*archive)) {
    archive_path_ = *archive;
    archive_name_ = PathToUtf8String(archive->filename());
  } else if (archive && !archive->empty()) {
    archive_name_ = PathToUtf8String(*archive);
  } else {
    archive_name_ = DefaultArchiveName();
  }
  if (archive_path_) {
    vfs_.Mount(*archive_path_);
  }
  node_count_ = vfs_.CountFiles();
  PublishEvent(EventCategory::kLifecycle, EventSeverity::kDebug, "handler.open", "Archive opened",
               {EventField("archive", archive_name_, FieldPrivacy::kHash),
                EventField("files", std::to_string(node_count_), FieldPrivacy::kPublic, true)});
}

std::string ArchiveHandler::DefaultArchiveName() {
  const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &now);
#else
  localtime_r(&now, &tm);
#endif
  std::ostringstream oss;
  oss << "Unnamed_" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << ".vdf";
  return oss.str();
}

bool ArchiveHandler::IsExistingFile() const {
  return archive_path_ && PathExists(*archive_path_);
}

void ArchiveHandler::SetGameVersion(std::string_view version) {
  options_.version = vfs::ParseGameVersion(version);
}

void ArchiveHandler::SetDebugging(bool debugging, bool full_debugging) {
  options_.debugging = debugging;
  options_.full_debugging = full_debugging;
  EventBus::Instance().Configure(LoggingConfig::FromEnvironment(debugging, full_debugging));
}

void ArchiveHandler::RequireArchive() const {
  if (!IsExistingFile()) {
    throw ArchiveNotLoadedError(archive_name_ + std::string(errors::msg::kArchiveEmptySuffix));
  }
}

vfs::VfsNode* ArchiveHandler::GetFile(std::string_view name) {
  PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "handler.get_file", "Loading",
               {EventField("name", std::string(name))});
  const bool scoped = name.find('/') != std::string_view::npos ||
                      name.find('\\') != std::string_view::npos;
  vfs::VfsNode* node = nullptr;
  if (!scoped) {
    node = vfs_.Find(name);
  } else if (const auto segments = SplitInternalPath(name); !segments.empty()) {
    node = core::PathResolver(vfs_.Root()).Resolve(segments);
  }
  if (!node) {
    PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "handler.get_file", "Failed to load",
                 {EventField("name", std::string(name))});
  }
  return node;
}

vfs::VfsNode* ArchiveHandler::InsertFile(const std::optional<std::string>& internal_path,
                                         const std::optional<std::filesystem::path>& source_path,
                                         const std::optional<std::vector<uint8_t>>& content) {
  PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "handler.insert", "Inserting",
               {EventField("internal_path", internal_path.value_or("")),
                EventField("source", source_path ? PathToUtf8String(*source_path) : std::string(),
                           FieldPrivacy::kHash)});
  core::TreeMerger merger(vfs_.Root(), options_.name_case);
  return merger.InsertFile(internal_path, source_path, content);
}

core::OperationReport ArchiveHandler::ExportFile(std::string_view name,
                                                 const std::filesystem::path& destination,
                                                 bool all_with_name) const {
  return core::TreeExporter(vfs_).ExportNode(name, destination, all_with_name);
}

core::OperationReport ArchiveHandler::ExportAll(const std::filesystem::path& destination) const {
  PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "handler.export_all",
               "Exporting all files", {EventField("archive", archive_name_, FieldPrivacy::kHash)});
  auto report = core::TreeExporter(vfs_).ExportAll(destination);
  if (report.ok) {
    PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "handler.export_all",
                 "Extracted files",
                 {EventField("files", std::to_string(node_count_), FieldPrivacy::kPublic, true),
                  EventField("destination", PathToUtf8String(destination), FieldPrivacy::kHash)});
  }
  return report;
}

core::OperationReport ArchiveHandler::RemoveFile(std::string_view name, vfs::VfsNode* parent,
                                                 bool all_with_name) {
  return core::Remover(vfs_).Remove(name, parent, all_with_name);
}

std::filesystem::path ArchiveHandler::ResolveSaveDestination(
    const std::filesystem::path& destination) const {
  std::filesystem::path target = destination;
  if (target.empty()) {
    target = archive_path_ ? *archive_path_ : core::ResolveDestination({}) / archive_name_;
  }
  if (PathToUtf8String(target.filename()).find('.') == std::string::npos) {
    target /= archive_name_;
  }
  return target;
}

core::OperationReport ArchiveHandler::Save(const std::filesystem::path& destination) {
  core::OperationReport report;
  try {
    const auto target = ResolveSaveDestination(destination);
    PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "handler.save", "Saving archive",
                 {EventField("destination", PathToUtf8String(target), FieldPrivacy::kHash),
                  EventField("version", std::string(vfs::GameVersionName(options_.version)))});
    vfs_.Save(target, options_.version);
    report.files = vfs_.CountFiles();
    PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "handler.save",
                 "Successfully saved",
                 {EventField("destination", PathToUtf8String(target), FieldPrivacy::kHash)});
  } catch (const std::exception& ex) {
    report.ok = false;
    report.error = ex.what();
    PublishEvent(EventCategory::kLifecycle, EventSeverity::kError, "handler.save",
                 "Failed to save archive due to an unhandled exception",
                 {EventField("error", report.error)});
  }
  return report;
}

void ArchiveHandler::PrintTree(std::ostream& out) const {
  PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "handler.print_tree",
               "Printing tree", {EventField("archive", archive_name_, FieldPrivacy::kHash)});
  try {
    for (const auto& line : core::TreePrinter::Lines(vfs_.Root())) {
      PrintMixed(line.is_directory ? ConsoleColor::kYellow : ConsoleColor::kGreen, line.prefix,
                 line.label, "\n", false, out);
    }
  } catch (const std::exception& ex) {
    PublishEvent(EventCategory::kLifecycle, EventSeverity::kError, "handler.print_tree",
                 "Failed to print tree due to an unhandled exception",
                 {EventField("error", ex.what())});
  }
}

} // namespace vdfs::orchestrator
