#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "vdfs/core/operation_report.h"
#include "vdfs/core/tree_merger.h"
#include "vdfs/vfs/archive_codec.h"
#include "vdfs/vfs/vfs.h"

namespace vdfs::orchestrator {

  struct HandlerOptions {
    bool debugging{false};
    bool full_debugging{false}; // also opens the storage category
    core::NameCase name_case{core::NameCase::kArchive};
    vfs::GameVersion version{vfs::GameVersion::kGothic2};
  };

  // One archive per handler: load, any number of operations, optional save.
  class ArchiveHandler {
  public:
    // archive may name a path that does not exist yet; the tree then starts
    // empty and the name is kept for saving.
    explicit ArchiveHandler(std::optional<std::filesystem::path> archive = std::nullopt,
                            HandlerOptions options = {});

    [[nodiscard]] const std::string& ArchiveName() const noexcept { return archive_name_; }
    [[nodiscard]] bool IsExistingFile() const;
    [[nodiscard]] size_t NodeCount() const noexcept { return node_count_; } // counted at load
    [[nodiscard]] vfs::GameVersion Version() const noexcept { return options_.version; }
    [[nodiscard]] const std::optional<std::filesystem::path>& ArchivePath() const noexcept {
      return archive_path_;
    }

    void SetGameVersion(std::string_view version); // "g1" or "g2"
    void SetGameVersion(vfs::GameVersion version) noexcept { options_.version = version; }
    void SetDebugging(bool debugging, bool full_debugging);

    vfs::Vfs& Tree() noexcept { return vfs_; }
    const vfs::Vfs& Tree() const noexcept { return vfs_; }

    // A bare name is looked up anywhere in the tree; a name with separators
    // ("ANIMS/HUMANS.MDS") is resolved from root. Null when nothing matches.
    vfs::VfsNode* GetFile(std::string_view name);

    // Throws ArchiveNotLoadedError ("<name> is empty.") when no archive was mounted.
    void RequireArchive() const;

    vfs::VfsNode* InsertFile(const std::optional<std::string>& internal_path,
                             const std::optional<std::filesystem::path>& source_path,
                             const std::optional<std::vector<uint8_t>>& content = std::nullopt);

    core::OperationReport ExportFile(std::string_view name, const std::filesystem::path& destination,
                                     bool all_with_name = false) const;
    core::OperationReport ExportAll(const std::filesystem::path& destination) const;

    core::OperationReport RemoveFile(std::string_view name, vfs::VfsNode* parent = nullptr,
                                     bool all_with_name = false);

    // Empty destination: the mounted path, else cwd/ArchiveName(). A final
    // component without '.' is a directory the archive is saved into.
    core::OperationReport Save(const std::filesystem::path& destination = {});

    // Colored tree (directories yellow, files green). Failures are logged.
    void PrintTree(std::ostream& out = std::cout) const;

    std::filesystem::path ResolveSaveDestination(const std::filesystem::path& destination) const;

  private:
    static std::string DefaultArchiveName();

    std::optional<std::filesystem::path> archive_path_;
    std::string archive_name_;
    HandlerOptions options_;
    vfs::Vfs vfs_;
    size_t node_count_{0};
  };

} // namespace vdfs::orchestrator
