#pragma once

#include <string_view>

namespace vdfs::errors::msg {
inline constexpr std::string_view kNodeNotFoundSuffix{" not found"};
inline constexpr std::string_view kSegmentIsFile{"Path segment already exists as a file: "};
inline constexpr std::string_view kFileShadowsDirectory{"A directory with this name already exists: "};
inline constexpr std::string_view kEmptyNodeName{"Node name must not be empty"};
inline constexpr std::string_view kRelativeNodeName{"Node name must not be a relative path component: "};
inline constexpr std::string_view kNoSourceOrInternalPath{"Neither the source path nor the internal path was provided"};
inline constexpr std::string_view kNoSourceOrContent{"Neither the source path nor content for the file was provided"};
inline constexpr std::string_view kInvalidGameVersion{"Invalid game version: "};
inline constexpr std::string_view kHostPathMissing{"Host path does not exist: "};
inline constexpr std::string_view kHostNotDirectory{"Host path is not a directory: "};
inline constexpr std::string_view kHostReadFailed{"Failed to read host file"};
inline constexpr std::string_view kHostMkdirFailed{"Failed to create host directory"};
inline constexpr std::string_view kAtomicReplaceFailed{"Atomic replace failed"};
inline constexpr std::string_view kArchiveMissing{"Archive was not found: "};
inline constexpr std::string_view kCodecUnavailable{"No archive codec can read "};
inline constexpr std::string_view kCodecCannotWrite{"No archive codec can write "};
inline constexpr std::string_view kContainerCodecMissing{"VDF container support was not built in (ZenKit not found): "};
inline constexpr std::string_view kArchiveUnreadable{"Failed to read VDF archive "};
inline constexpr std::string_view kArchiveWriteFailed{"Failed to write VDF archive "};
inline constexpr std::string_view kArchiveEmptySuffix{" is empty."};
inline constexpr std::string_view kDigestFailed{"SHA-256 digest failed"};
}  // namespace vdfs::errors::msg
