#pragma once
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace vdfs {

// Archive names are matched ASCII case-insensitively; non-ASCII bytes compare as-is.
inline char ToLowerAscii(char ch) noexcept {
  const auto uch = static_cast<unsigned char>(ch);
  return (uch >= 'A' && uch <= 'Z') ? static_cast<char>(uch - 'A' + 'a') : ch;
}

inline char ToUpperAscii(char ch) noexcept {
  const auto uch = static_cast<unsigned char>(ch);
  return (uch >= 'a' && uch <= 'z') ? static_cast<char>(uch - 'a' + 'A') : ch;
}

inline std::string ToLower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), ToLowerAscii);
  return out;
}

inline std::string ToUpper(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), ToUpperAscii);
  return out;
}

inline bool EqualsInsensitive(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (size_t i = 0; i < lhs.size(); ++i) {
    if (ToLowerAscii(lhs[i]) != ToLowerAscii(rhs[i])) {
      return false;
    }
  }
  return true;
}

inline bool ContainsInsensitive(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) {
    return true;
  }
  return ToLower(haystack).find(ToLower(needle)) != std::string::npos;
}

// Title-cases for display: a letter following a non-letter is upper-cased,
// every other letter lower-cased ("readme.txt" -> "Readme.Txt").
inline std::string TitleCase(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  bool previous_alpha = false;
  for (char ch : value) {
    const bool alpha = std::isalpha(static_cast<unsigned char>(ch)) != 0;
    if (alpha) {
      out.push_back(previous_alpha ? ToLowerAscii(ch) : ToUpperAscii(ch));
    } else {
      out.push_back(ch);
    }
    previous_alpha = alpha;
  }
  return out;
}

// Splits an internal archive path on '/' and '\'. Empty and "." segments are dropped.
inline std::vector<std::string> SplitInternalPath(std::string_view path) {
  std::vector<std::string> segments;
  std::string current;
  auto flush = [&]() {
    if (!current.empty() && current != ".") {
      segments.push_back(current);
    }
    current.clear();
  };
  for (char ch : path) {
    if (ch == '/' || ch == '\\') {
      flush();
    } else {
      current.push_back(ch);
    }
  }
  flush();
  return segments;
}

inline std::string PathToUtf8String(const std::filesystem::path& path) {
#if defined(_WIN32)
  const std::u8string u8 = path.u8string();
  std::string result;
  result.reserve(u8.size());
  for (auto ch : u8) {
    result.push_back(static_cast<char>(ch));
  }
  return result;
#else
  return path.string();
#endif
}

} // namespace vdfs
