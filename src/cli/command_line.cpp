#include "vdfs/cli/command_line.h"

#include <algorithm>
#include <exception>
#include <system_error>
#include <vector>

#include "vdfs/common.h"
#include "vdfs/errors.h"
#include "vdfs/orchestrator/archive_handler.h"
#include "vdfs/orchestrator/console.h"
#include "vdfs/orchestrator/event_bus.h"

namespace vdfs::cli {

namespace {

using orchestrator::ConsoleColor;
using orchestrator::EventField;
using orchestrator::FieldPrivacy;
using orchestrator::PrintColored;

void Abort(std::string_view message, std::ostream& out) {
  PrintColored(ConsoleColor::kRed, "Aborting: " + std::string(message), "\n", out);
}

int HandleAdd(orchestrator::ArchiveHandler& handler, const std::string& source,
              const std::string& destination, const std::filesystem::path& output_path,
              std::ostream& out) {
  if (source.empty()) {
    Abort("No input file for insertion was provided.", out);
    return kExitUsage;
  }
  const auto star = source.find('*');
  if (star == std::string::npos) {
    handler.InsertFile(destination, std::filesystem::path(source));
    handler.Save(output_path);
    return kExitOk;
  }

  const std::filesystem::path parent =
      star == 0 ? std::filesystem::path(".") : std::filesystem::path(source.substr(0, star));
  const auto filter = WildcardFilter(source);
  std::error_code ec;
  if (!std::filesystem::is_directory(parent, ec)) {
    Abort(PathToUtf8String(parent) + " was not found.", out);
    return kExitIO;
  }
  std::vector<std::filesystem::path> matches;
  std::filesystem::directory_iterator it(parent, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, errors::io::kHostReadFailed,
                std::string(errors::msg::kHostReadFailed) + ": " + PathToUtf8String(parent),
                ec.value()};
  }
  for (const auto& entry : it) {
    if (ContainsInsensitive(PathToUtf8String(entry.path().filename()), filter)) {
      matches.push_back(entry.path());
    }
  }
  std::sort(matches.begin(), matches.end());
  for (const auto& match : matches) {
    handler.InsertFile(destination, match);
  }
  handler.Save(output_path);
  return kExitOk;
}

} // namespace

void PrintUsage(std::ostream& out) {
  out << "vdfs - inspect and edit VDF archives\n";
  out << "Usage:\n";
  out << "  vdfs <archive.vdf> [flags]\n";
  out << "\nFlags:\n";
  out << "  -g1, --gothic1           Save as a Gothic 1 archive (default Gothic 2)\n";
  out << "  --game=g1|g2             Select the archive version\n";
  out << "  -o,  --output_path PATH  Output location for unpack, extract and save\n";
  out << "  -u,  --unpack            Unpack the archive to PATH or the current directory\n";
  out << "  -e,  --extract NAME      Extract a file or directory; *TEXT extracts every file containing TEXT\n";
  out << "  -a,  --add SRC DEST      Insert a host file or directory at DEST; SRC may be dir/*TEXT\n";
  out << "  -r,  --remove NAME       Remove a file or directory; *TEXT removes every file containing TEXT\n";
  out << "  -v,  --view_vfs_tree     Print the archive tree\n";
  out << "  -d,  --debug             Enable debug logging\n";
  out << "  -f,  --full_debug        Enable debug logging including storage internals\n";
  out << "\nEnvironment:\n";
  out << "  VDFS_LOG_PATH            Also write JSON-lines logs to this file\n";
  out << "  VDFS_LOG_MAX_SIZE        Rotate the JSON log at this many bytes\n";
}

std::string WildcardFilter(std::string_view value) {
  const auto star = value.find('*');
  if (star == std::string_view::npos) {
    return std::string(value);
  }
  auto rest = value.substr(star + 1);
  return std::string(rest.substr(0, rest.find('*')));
}

bool HasVdfExtension(std::string_view path) {
  return path.size() >= 4 && EqualsInsensitive(path.substr(path.size() - 4), ".vdf");
}

bool ParseArguments(int argc, const char* const* argv, CliOptions& options) {
  auto next_value = [&](int& index, std::string& out) {
    if (index + 1 >= argc) {
      return false;
    }
    out = argv[++index];
    return true;
  };

  for (int index = 1; index < argc; ++index) {
    std::string_view arg = argv[index];
    std::string value;
    if (arg == "-g1" || arg == "--gothic1") {
      options.gothic1 = true;
    } else if (arg.rfind("--game=", 0) == 0) {
      options.game = std::string(arg.substr(std::string_view("--game=").size()));
    } else if (arg == "-o" || arg == "--output_path") {
      if (!next_value(index, value)) {
        return false;
      }
      options.output_path = value;
    } else if (arg == "-u" || arg == "--unpack") {
      options.unpack = true;
    } else if (arg == "-e" || arg == "--extract") {
      if (!next_value(index, value)) {
        return false;
      }
      options.extract = value;
    } else if (arg == "-a" || arg == "--add") {
      std::string destination;
      if (!next_value(index, value) || !next_value(index, destination)) {
        return false;
      }
      options.add = std::make_pair(value, destination);
    } else if (arg == "-r" || arg == "--remove") {
      if (!next_value(index, value)) {
        return false;
      }
      options.remove = value;
    } else if (arg == "-v" || arg == "--view_vfs_tree") {
      options.view = true;
    } else if (arg == "-d" || arg == "--debug") {
      options.debug = true;
    } else if (arg == "-f" || arg == "--full_debug") {
      options.full_debug = true;
    } else if (arg == "-h" || arg == "--help") {
      return false;
    } else if (!arg.empty() && arg.front() == '-') {
      std::cerr << "Unknown flag: " << arg << '\n';
      return false;
    } else if (options.archive.empty()) {
      options.archive = std::string(arg);
    } else {
      return false;
    }
  }
  return !options.archive.empty();
}

std::string_view DomainPrefix(ErrorDomain domain) {
  switch (domain) {
  case ErrorDomain::Vfs:
    return "Archive error";
  case ErrorDomain::IO:
    return "I/O error";
  case ErrorDomain::Validation:
    return "Validation error";
  case ErrorDomain::Config:
    return "Configuration error";
  case ErrorDomain::Dependency:
    return "Dependency error";
  case ErrorDomain::State:
    return "State error";
  case ErrorDomain::Internal:
    return "Internal error";
  }
  return "Error";
}

int ExitCodeFor(const Error& err) {
  switch (err.domain) {
  case ErrorDomain::Validation:
  case ErrorDomain::Config:
    return kExitUsage;
  case ErrorDomain::Vfs:
  case ErrorDomain::IO:
  case ErrorDomain::Dependency:
  case ErrorDomain::State:
  case ErrorDomain::Internal:
  default:
    return kExitIO;
  }
}

void ReportError(const Error& err, std::ostream& err_out) {
  PrintColored(ConsoleColor::kRed, std::string(DomainPrefix(err.domain)) + ": " + err.what(), "\n",
               err_out);

  std::vector<EventField> fields;
  fields.emplace_back("domain", std::string(DomainPrefix(err.domain)));
  fields.emplace_back("code", std::to_string(err.code), FieldPrivacy::kPublic, true);
  if (err.native_code.has_value()) {
    fields.emplace_back("native_code", std::to_string(*err.native_code), FieldPrivacy::kPublic, true);
  }
  for (const auto& context : err.context) {
    fields.emplace_back("context", context, FieldPrivacy::kHash);
  }
  try {
    orchestrator::PublishEvent(orchestrator::EventCategory::kDiagnostics,
                               orchestrator::EventSeverity::kError, "cli.error", err.what(),
                               std::move(fields));
  } catch (const std::exception& publish_error) {
    std::clog << "{\"event\":\"eventbus_error\",\"message\":\"error report publish failed\",\"detail\":\""
              << publish_error.what() << "\"}" << std::endl;
  }
}

int Run(const CliOptions& options, std::ostream& out) {
  if (!HasVdfExtension(options.archive)) {
    Abort(options.archive + " is not a valid VDF archive.", out);
    return kExitUsage;
  }
  std::error_code ec;
  if (!options.add && !std::filesystem::exists(options.archive, ec)) {
    Abort(options.archive + " is not a valid VDF archive.", out);
    return kExitUsage;
  }

  orchestrator::HandlerOptions handler_options;
  handler_options.debugging = options.debug;
  handler_options.full_debugging = options.full_debug;
  orchestrator::ArchiveHandler handler(std::filesystem::path(options.archive), handler_options);

  if (options.gothic1) {
    handler.SetGameVersion("g1");
  }
  if (options.game) {
    handler.SetGameVersion(*options.game);
  }

  try {
    if (options.view || options.unpack || options.extract || options.remove) {
      handler.RequireArchive();
    }
  } catch (const ArchiveNotLoadedError& err) {
    Abort(err.what(), out);
    return kExitIO;
  }
  if (options.view) {
    handler.PrintTree(out);
  }

  if (options.unpack) {
    handler.ExportAll(options.output_path);
  } else if (options.extract) {
    const auto& node = *options.extract;
    const bool wildcard = node.find('*') != std::string::npos;
    handler.ExportFile(WildcardFilter(node), options.output_path, wildcard);
  } else if (options.add) {
    return HandleAdd(handler, options.add->first, options.add->second, options.output_path, out);
  } else if (options.remove) {
    const auto& node = *options.remove;
    const bool wildcard = node.find('*') != std::string::npos;
    handler.RemoveFile(WildcardFilter(node), nullptr, wildcard);
    handler.Save(options.output_path);
  }
  return kExitOk;
}

int Main(int argc, const char* const* argv, std::ostream& out, std::ostream& err_out) {
  try {
    CliOptions options;
    if (!ParseArguments(argc, argv, options)) {
      PrintUsage(err_out);
      return kExitUsage;
    }
    return Run(options, out);
  } catch (const Error& err) {
    ReportError(err, err_out);
    return ExitCodeFor(err);
  } catch (const std::exception& err) {
    PrintColored(ConsoleColor::kRed, std::string("I/O error: ") + err.what(), "\n", err_out);
    return kExitIO;
  }
}

} // namespace vdfs::cli
