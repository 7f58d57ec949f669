#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace vdfs {
  enum class ErrorDomain : std::uint16_t {
    Vfs = 0x01,
    IO = 0x02,
    Validation = 0x04,
    Config = 0x05,
    Dependency = 0x06,
    State = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes so propagated errno values never
  // collide with framework codes.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Vfs:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::Dependency:
      return 0x0600;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0;
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace vfs {
      inline constexpr int kNodeNotFound = Make(ErrorDomain::Vfs, 0x01);
      inline constexpr int kNameCollision = Make(ErrorDomain::Vfs, 0x02);
      inline constexpr int kNotADirectory = Make(ErrorDomain::Vfs, 0x03);
      inline constexpr int kInvalidNodeName = Make(ErrorDomain::Vfs, 0x04);
    } // namespace vfs

    namespace io {
      inline constexpr int kHostReadFailed = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kHostWriteFailed = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kArchiveMissing = Make(ErrorDomain::IO, 0x03);
      inline constexpr int kAtomicReplaceFailed = Make(ErrorDomain::IO, 0x04);
      inline constexpr int kHostPathMissing = Make(ErrorDomain::IO, 0x05);
      inline constexpr int kArchiveUnreadable = Make(ErrorDomain::IO, 0x06);
      inline constexpr int kArchiveWriteFailed = Make(ErrorDomain::IO, 0x07);
    } // namespace io

    namespace validation {
      inline constexpr int kInvalidData = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kInvalidGameVersion = Make(ErrorDomain::Validation, 0x02);
    } // namespace validation

    namespace dependency {
      inline constexpr int kCodecUnavailable = Make(ErrorDomain::Dependency, 0x01);
      inline constexpr int kDigestFailed = Make(ErrorDomain::Dependency, 0x02);
    } // namespace dependency

    namespace state {
      inline constexpr int kArchiveNotLoaded = Make(ErrorDomain::State, 0x01);
    } // namespace state

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          context(std::move(ctx)) {}
  };

  struct NodeNotFoundError : public Error {
    explicit NodeNotFoundError(std::string msg)
        : Error(ErrorDomain::Vfs, errors::vfs::kNodeNotFound, std::move(msg)) {}
  };

  struct NameCollisionError : public Error {
    explicit NameCollisionError(std::string msg)
        : Error(ErrorDomain::Vfs, errors::vfs::kNameCollision, std::move(msg)) {}
  };

  struct InvalidDataError : public Error {
    explicit InvalidDataError(std::string msg)
        : Error(ErrorDomain::Validation, errors::validation::kInvalidData, std::move(msg)) {}
  };

  struct InvalidGameVersionError : public Error {
    explicit InvalidGameVersionError(std::string msg)
        : Error(ErrorDomain::Validation, errors::validation::kInvalidGameVersion,
                std::move(msg)) {}
  };

  struct ArchiveNotLoadedError : public Error {
    explicit ArchiveNotLoadedError(std::string msg)
        : Error(ErrorDomain::State, errors::state::kArchiveNotLoaded, std::move(msg)) {}
  };
} // namespace vdfs
