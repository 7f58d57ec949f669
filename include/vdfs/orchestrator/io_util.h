#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <string_view>
#include <vector>

#include "vdfs/error.h"

namespace vdfs::orchestrator {

struct AtomicReplaceHooks { // test seam for crash simulation
  std::function<void(const std::filesystem::path&, const std::filesystem::path&)> before_rename;
};

// Reads the whole host file. Throws Error{IO} with the errno on failure.
std::vector<uint8_t> ReadHostFile(const std::filesystem::path& path);

// Writes payload to target through a temporary sibling file that is renamed
// into place, so a crash never leaves a half-written target behind.
void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks = {});

// Swaps a fully staged directory into target. An existing target is moved
// aside first and deleted only after the staged tree is in place.
void ReplaceDirectory(const std::filesystem::path& staged, const std::filesystem::path& target,
                      const AtomicReplaceHooks& hooks = {});

// create_directories with Error{IO} reporting.
void EnsureHostDirectory(const std::filesystem::path& path);

// Unique sibling path "<target>.<tag>-<counter>" that does not exist yet.
std::filesystem::path MakeSiblingPath(const std::filesystem::path& target, std::string_view tag);

}  // namespace vdfs::orchestrator
