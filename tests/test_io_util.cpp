#include "vdfs/orchestrator/io_util.h"

#include <array>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "test_support.h"

namespace {

  void TestAtomicReplace(const std::filesystem::path& dir) {
    using vdfs::orchestrator::AtomicReplace;
    using vdfs::orchestrator::AtomicReplaceHooks;

    const auto target = dir / "atomic_replace.bin";
    vdfs_test::WriteText(target, "\xDE\xAD\xBE\xEF");

    AtomicReplaceHooks hooks;
    hooks.before_rename = [](const std::filesystem::path&, const std::filesystem::path&) {
      throw std::runtime_error("simulated crash");
    };

    std::array<uint8_t, 4> update{0xBA, 0xAD, 0xF0, 0x0D};
    bool threw = false;
    try {
      AtomicReplace(target, std::span<const uint8_t>(update.data(), update.size()), hooks);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw && "Expected simulated crash before rename");

    auto bytes = vdfs::orchestrator::ReadHostFile(target);
    assert(bytes.size() == 4);
    assert(bytes[0] == 0xDE && bytes[1] == 0xAD && bytes[2] == 0xBE && bytes[3] == 0xEF);
    assert(vdfs_test::CountHostFiles(dir) == 1 && "temporary file cleaned up");

    AtomicReplace(target, std::span<const uint8_t>(update.data(), update.size()));
    bytes = vdfs::orchestrator::ReadHostFile(target);
    assert(bytes.size() == 4);
    assert(bytes[0] == 0xBA && bytes[1] == 0xAD && bytes[2] == 0xF0 && bytes[3] == 0x0D);

    // new files and empty payloads
    AtomicReplace(dir / "empty.bin", {});
    assert(vdfs::orchestrator::ReadHostFile(dir / "empty.bin").empty());
  }

  void TestReplaceDirectory(const std::filesystem::path& dir) {
    using vdfs::orchestrator::ReplaceDirectory;

    const auto target = dir / "tree";
    vdfs_test::WriteText(target / "old.txt", "old");
    const auto staged = vdfs::orchestrator::MakeSiblingPath(target, "staging");
    assert(staged.parent_path() == dir);
    assert(!std::filesystem::exists(staged));
    vdfs_test::WriteText(staged / "new.txt", "new");

    vdfs::orchestrator::AtomicReplaceHooks hooks;
    hooks.before_rename = [](const std::filesystem::path&, const std::filesystem::path&) {
      throw std::runtime_error("simulated crash");
    };
    bool threw = false;
    try {
      ReplaceDirectory(staged, target, hooks);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
    assert(vdfs_test::ReadText(target / "old.txt") == "old" && "previous tree restored");
    assert(std::filesystem::exists(staged));

    ReplaceDirectory(staged, target);
    assert(!std::filesystem::exists(target / "old.txt"));
    assert(vdfs_test::ReadText(target / "new.txt") == "new");
    assert(!std::filesystem::exists(staged));
    size_t siblings = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
      (void)entry;
      ++siblings;
    }
    assert(siblings == 1 && "backup removed after the swap");
  }

  void TestReadMissing(const std::filesystem::path& dir) {
    bool threw = false;
    try {
      vdfs::orchestrator::ReadHostFile(dir / "missing.bin");
    } catch (const vdfs::Error& err) {
      threw = err.domain == vdfs::ErrorDomain::IO && err.code == vdfs::errors::io::kHostReadFailed;
    }
    assert(threw);

    threw = false;
    vdfs_test::WriteText(dir / "file", "x");
    try {
      vdfs::orchestrator::EnsureHostDirectory(dir / "file");
    } catch (const vdfs::Error& err) {
      threw = err.code == vdfs::errors::io::kHostWriteFailed;
    }
    assert(threw);
  }

} // namespace

int main() {
  {
    vdfs_test::TempDir temp("vdfs_io_atomic_");
    TestAtomicReplace(temp.path());
  }
  {
    vdfs_test::TempDir temp("vdfs_io_tree_");
    TestReplaceDirectory(temp.path());
  }
  {
    vdfs_test::TempDir temp("vdfs_io_read_");
    TestReadMissing(temp.path());
  }
  std::cout << "io util tests ok\n";
  return 0;
}
