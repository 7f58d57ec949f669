#include "vdfs/orchestrator/io_util.h"

#include "vdfs/common.h"
#include "vdfs/errors.h"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace vdfs::orchestrator {
namespace {

class ErrorContext { // accumulate nested call context
 public:
  void Push(std::string context) { context_stack_.push_back(std::move(context)); }
  void Pop() {
    if (!context_stack_.empty()) {
      context_stack_.pop_back();
    }
  }
  [[nodiscard]] std::vector<std::string> Stack() const { return context_stack_; }
  [[nodiscard]] std::string Format(std::string_view message) const {
    std::ostringstream oss;
    oss << message;
    for (auto it = context_stack_.rbegin(); it != context_stack_.rend(); ++it) {
      oss << "\n  while: " << *it;
    }
    return oss.str();
  }

 private:
  std::vector<std::string> context_stack_;
};

class ScopedErrorContext {
 public:
  ScopedErrorContext(ErrorContext& ctx, std::string description) : ctx_(ctx) {
    ctx_.Push(std::move(description));
  }
  ScopedErrorContext(const ScopedErrorContext&) = delete;
  ScopedErrorContext& operator=(const ScopedErrorContext&) = delete;
  ~ScopedErrorContext() { ctx_.Pop(); }

 private:
  ErrorContext& ctx_;
};

std::vector<std::string> MergeContext(const std::vector<std::string>& existing,
                                      const ErrorContext& ctx) {
  auto merged = existing;
  auto stack = ctx.Stack();
  merged.insert(merged.end(), stack.begin(), stack.end());
  return merged;
}

[[noreturn]] void ThrowIoError(const ErrorContext& ctx, int code, std::string message,
                               std::optional<int> native = std::nullopt) {
  throw Error{ErrorDomain::IO, code, ctx.Format(std::move(message)), native, ctx.Stack()};
}

Error AugmentError(const Error& err, const ErrorContext& ctx) {
  return Error{err.domain, err.code, ctx.Format(err.what()), err.native_code,
               MergeContext(err.context, ctx)};
}

template <typename Func>
auto WithContext(ErrorContext& ctx, std::string description, Func&& fn)
    -> std::invoke_result_t<Func&> {
  ScopedErrorContext scoped(ctx, std::move(description));
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Func&>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const Error& err) {
    if (err.context.empty()) {
      throw AugmentError(err, ctx);
    }
    throw;
  } catch (const std::system_error& sys_err) {
    throw Error{ErrorDomain::IO, errors::io::kHostWriteFailed, ctx.Format(sys_err.what()),
                sys_err.code().value(), ctx.Stack()};
  }
}

class TempPathGuard { // removes a staged file or directory unless released
 public:
  explicit TempPathGuard(std::filesystem::path path) noexcept : path_(std::move(path)) {}
  TempPathGuard(const TempPathGuard&) = delete;
  TempPathGuard& operator=(const TempPathGuard&) = delete;
  ~TempPathGuard() noexcept {
    if (!path_.empty()) {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
      if (ec) {
        std::cerr << "TempPathGuard cleanup failed for " << path_ << ": " << ec.message() << '\n';
      }
    }
  }

  void Release() noexcept { path_.clear(); }

 private:
  std::filesystem::path path_;
};

#ifndef _WIN32
void WriteAll(int fd, std::span<const uint8_t> payload, ErrorContext& ctx) {
  size_t written = 0;
  while (written < payload.size()) {
    auto chunk = ::write(fd, payload.data() + written, payload.size() - written);
    if (chunk < 0) {
      const int saved_errno = errno;
      if (saved_errno == EINTR) {
        continue;
      }
      ThrowIoError(ctx, errors::io::kAtomicReplaceFailed,
                   std::string(errors::msg::kAtomicReplaceFailed) + ": write failed", saved_errno);
    }
    if (chunk == 0) {
      ThrowIoError(ctx, errors::io::kAtomicReplaceFailed,
                   std::string(errors::msg::kAtomicReplaceFailed) + ": short write");
    }
    written += static_cast<size_t>(chunk);
  }
}

void WritePayloadFile(const std::filesystem::path& path, std::span<const uint8_t> payload,
                      ErrorContext& ctx) {
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (fd < 0) {
    const int saved_errno = errno;
    ThrowIoError(ctx, errors::io::kAtomicReplaceFailed,
                 std::string(errors::msg::kAtomicReplaceFailed) + ": open failed", saved_errno);
  }
  try {
    WriteAll(fd, payload, ctx);
    if (::fsync(fd) != 0 && errno != EINVAL) {
      const int saved_errno = errno;
      ThrowIoError(ctx, errors::io::kAtomicReplaceFailed,
                   std::string(errors::msg::kAtomicReplaceFailed) + ": fsync failed", saved_errno);
    }
  } catch (...) {
    ::close(fd);
    throw;
  }
  if (::close(fd) != 0) {
    const int saved_errno = errno;
    ThrowIoError(ctx, errors::io::kAtomicReplaceFailed,
                 std::string(errors::msg::kAtomicReplaceFailed) + ": close failed", saved_errno);
  }
}
#else
void WritePayloadFile(const std::filesystem::path& path, std::span<const uint8_t> payload,
                      ErrorContext& ctx) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    ThrowIoError(ctx, errors::io::kAtomicReplaceFailed,
                 std::string(errors::msg::kAtomicReplaceFailed) + ": open failed");
  }
  out.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
  out.flush();
  if (!out) {
    ThrowIoError(ctx, errors::io::kAtomicReplaceFailed,
                 std::string(errors::msg::kAtomicReplaceFailed) + ": write failed");
  }
}
#endif

}  // namespace

std::filesystem::path MakeSiblingPath(const std::filesystem::path& target, std::string_view tag) {
  static std::atomic<uint64_t> counter{0};
  const auto stamp = static_cast<unsigned long long>(
      std::chrono::steady_clock::now().time_since_epoch().count());
  auto dir = target.parent_path();
  auto base = target.filename();
  if (base.empty()) {
    base = target.parent_path().filename();
    dir = target.parent_path().parent_path();
  }
  for (;;) {
    std::filesystem::path name = base;
    name += ".";
    name += std::string(tag);
    name += "-" + std::to_string(stamp) + "-" + std::to_string(counter.fetch_add(1));
    auto candidate = dir / name;
    std::error_code ec;
    if (!std::filesystem::exists(candidate, ec)) {
      return candidate;
    }
  }
}

std::vector<uint8_t> ReadHostFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    const int saved_errno = errno;
    throw Error{ErrorDomain::IO, errors::io::kHostReadFailed,
                std::string(errors::msg::kHostReadFailed) + ": " + PathToUtf8String(path),
                saved_errno};
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw Error{ErrorDomain::IO, errors::io::kHostReadFailed,
                std::string(errors::msg::kHostReadFailed) + ": " + PathToUtf8String(path)};
  }
  return bytes;
}

void EnsureHostDirectory(const std::filesystem::path& path) {
  if (path.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, errors::io::kHostWriteFailed,
                std::string(errors::msg::kHostMkdirFailed) + ": " + PathToUtf8String(path),
                ec.value()};
  }
  if (!std::filesystem::is_directory(path, ec)) {
    throw Error{ErrorDomain::IO, errors::io::kHostWriteFailed,
                std::string(errors::msg::kHostNotDirectory) + PathToUtf8String(path), ENOTDIR};
  }
}

void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks) {
  ErrorContext ctx;
  const std::string target_utf8 = target.empty() ? std::string("<empty>") : PathToUtf8String(target);
  ScopedErrorContext root(ctx, "atomic replace target=" + target_utf8);

  if (target.empty()) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidData,
                ctx.Format("Target path required"), std::nullopt, ctx.Stack()};
  }

  auto temp_path = MakeSiblingPath(target, "tmp");
  TempPathGuard cleanup(temp_path);

  WithContext(ctx, "writing temporary payload file", [&] { WritePayloadFile(temp_path, payload, ctx); });

  if (hooks.before_rename) {
    WithContext(ctx, "executing before_rename hook", [&] { hooks.before_rename(temp_path, target); });
  }

  WithContext(ctx, "renaming temporary file into place", [&] {
    std::error_code ec;
    std::filesystem::rename(temp_path, target, ec);
    if (ec) {
      ThrowIoError(ctx, errors::io::kAtomicReplaceFailed,
                   std::string(errors::msg::kAtomicReplaceFailed) + ": rename failed", ec.value());
    }
  });
  cleanup.Release();
}

void ReplaceDirectory(const std::filesystem::path& staged, const std::filesystem::path& target,
                      const AtomicReplaceHooks& hooks) {
  ErrorContext ctx;
  ScopedErrorContext root(ctx, "replace directory target=" + PathToUtf8String(target));

  std::error_code ec;
  std::optional<std::filesystem::path> backup;
  if (std::filesystem::exists(target, ec)) {
    backup = MakeSiblingPath(target, "old");
    WithContext(ctx, "moving previous tree aside", [&] {
      std::error_code rename_ec;
      std::filesystem::rename(target, *backup, rename_ec);
      if (rename_ec) {
        ThrowIoError(ctx, errors::io::kAtomicReplaceFailed,
                     std::string(errors::msg::kAtomicReplaceFailed) + ": backup rename failed",
                     rename_ec.value());
      }
    });
  }

  try {
    if (hooks.before_rename) {
      WithContext(ctx, "executing before_rename hook", [&] { hooks.before_rename(staged, target); });
    }
    WithContext(ctx, "renaming staged tree into place", [&] {
      std::error_code rename_ec;
      std::filesystem::rename(staged, target, rename_ec);
      if (rename_ec) {
        ThrowIoError(ctx, errors::io::kAtomicReplaceFailed,
                     std::string(errors::msg::kAtomicReplaceFailed) + ": rename failed",
                     rename_ec.value());
      }
    });
  } catch (...) {
    if (backup) {
      std::error_code restore_ec;
      std::filesystem::rename(*backup, target, restore_ec);
      if (restore_ec) {
        std::cerr << "ReplaceDirectory could not restore " << target << ": " << restore_ec.message()
                  << '\n';
      }
    }
    throw;
  }

  if (backup) {
    std::filesystem::remove_all(*backup, ec);
    if (ec) {
      std::cerr << "ReplaceDirectory cleanup failed for " << *backup << ": " << ec.message() << '\n';
    }
  }
}

}  // namespace vdfs::orchestrator
