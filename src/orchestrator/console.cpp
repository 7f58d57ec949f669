#include "vdfs/orchestrator/console.h"

namespace vdfs::orchestrator {
namespace {
constexpr std::string_view kReset = "\x1b[0m";
}

std::string_view AnsiCode(ConsoleColor color) noexcept {
  switch (color) {
  case ConsoleColor::kRed:
    return "\x1b[31m";
  case ConsoleColor::kGreen:
    return "\x1b[32m";
  case ConsoleColor::kYellow:
    return "\x1b[33m";
  case ConsoleColor::kBlue:
    return "\x1b[34m";
  case ConsoleColor::kNone:
    break;
  }
  return {};
}

void PrintColored(ConsoleColor color, std::string_view text, std::string_view end, std::ostream& out) {
  out << AnsiCode(color) << text << kReset << end;
}

void PrintMixed(ConsoleColor color, std::string_view plain, std::string_view colored,
                std::string_view end, bool colored_first, std::ostream& out) {
  if (colored_first) {
    PrintColored(color, colored, "", out);
    out << plain << end;
    return;
  }
  out << plain;
  PrintColored(color, colored, end, out);
}

}  // namespace vdfs::orchestrator
