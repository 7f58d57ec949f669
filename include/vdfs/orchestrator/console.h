#pragma once

#include <iostream>
#include <string_view>

namespace vdfs::orchestrator {

enum class ConsoleColor { kNone, kRed, kGreen, kYellow, kBlue };

// ANSI escape that starts color; empty for kNone.
std::string_view AnsiCode(ConsoleColor color) noexcept;

// text wrapped in color and a reset, then end.
void PrintColored(ConsoleColor color, std::string_view text, std::string_view end = "\n",
                  std::ostream& out = std::cout);

// plain followed by colored (or the reverse with colored_first).
void PrintMixed(ConsoleColor color, std::string_view plain, std::string_view colored,
                std::string_view end = "\n", bool colored_first = false,
                std::ostream& out = std::cout);

}  // namespace vdfs::orchestrator
