#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "vdfs/core/host_tree.h"
#include "vdfs/core/path_resolver.h"
#include "vdfs/vfs/node.h"

namespace vdfs::core {

// Casing applied to the node names an insertion creates.
//   kArchive   file names given to InsertFile (with content, or a single host
//              file) are upper-cased. Internal directory segments and every
//              name a host directory merge creates keep their case.
//   kUpper     every created name is upper-cased.
//   kPreserve  names are stored as given.
enum class NameCase { kArchive, kUpper, kPreserve };

// Where a created name comes from.
enum class NameRole { kDirectorySegment, kInsertedFile, kMergedEntry };

std::string ApplyNameCase(std::string_view name, NameCase name_case, NameRole role);

// True for the internal paths that mean "archive root": "", ".", "/", "\", "./", ".\".
bool IsRootInternalPath(std::string_view internal_path);

class TreeMerger {
public:
  explicit TreeMerger(vfs::VfsNode& root, NameCase name_case = NameCase::kArchive);

  // Creates description (the directory itself and everything below it) under
  // target, root when null. Existing directories are reused. Returns the
  // directory node that mirrors description.
  vfs::VfsNode& Merge(const HostTreeEntry& description, vfs::VfsNode* target = nullptr) const;

  vfs::VfsNode& MergeHostDirectory(const std::filesystem::path& host_directory,
                                   vfs::VfsNode* target = nullptr) const;

  vfs::VfsNode& InsertHostFile(const std::filesystem::path& host_file,
                               vfs::VfsNode* target = nullptr) const;

  // Insert entry point used by the handler:
  //  - content + "a/b/file.ext": file created in the resolved parent directory
  //  - "a/b" (no '.' in the last segment) without a source: directory only
  //  - host file or directory + internal path: placed inside that directory,
  //    or under root for the root paths accepted by IsRootInternalPath
  // Returns the created file, the resolved directory, or the merged directory.
  vfs::VfsNode* InsertFile(const std::optional<std::string>& internal_path,
                           const std::optional<std::filesystem::path>& source_path,
                           const std::optional<std::vector<uint8_t>>& content = std::nullopt) const;

  NameCase Casing() const noexcept { return name_case_; }

private:
  std::vector<std::string> CasedSegments(std::string_view internal_path) const;

  vfs::VfsNode* root_;
  PathResolver resolver_;
  NameCase name_case_;
};

}  // namespace vdfs::core
