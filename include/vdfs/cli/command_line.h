#pragma once

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "vdfs/error.h"

namespace vdfs::cli {

  // sysexits-style process results
  inline constexpr int kExitOk = 0;
  inline constexpr int kExitUsage = 64;
  inline constexpr int kExitIO = 74;

  struct CliOptions {
    std::string archive;
    bool gothic1 = false;
    std::optional<std::string> game;
    std::filesystem::path output_path;
    bool unpack = false;
    std::optional<std::string> extract;
    std::optional<std::pair<std::string, std::string>> add; // source, internal destination
    std::optional<std::string> remove;
    bool view = false;
    bool debug = false;
    bool full_debug = false;
  };

  void PrintUsage(std::ostream& out = std::cerr);

  // Text after the first '*', up to a following '*'.
  std::string WildcardFilter(std::string_view value);

  bool HasVdfExtension(std::string_view path);

  // Returns false on a malformed command line or -h.
  bool ParseArguments(int argc, const char* const* argv, CliOptions& options);

  std::string_view DomainPrefix(ErrorDomain domain);
  int ExitCodeFor(const Error& err);

  // Red message on err_out plus a cli.error event.
  void ReportError(const Error& err, std::ostream& err_out = std::cerr);

  // Executes one parsed command line. Abort messages and the tree view go to out.
  int Run(const CliOptions& options, std::ostream& out = std::cout);

  // Parse, run and map escaping errors to an exit code.
  int Main(int argc, const char* const* argv, std::ostream& out = std::cout,
           std::ostream& err_out = std::cerr);

} // namespace vdfs::cli
