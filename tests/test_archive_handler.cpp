#include "vdfs/orchestrator/archive_handler.h"
#include "vdfs/common.h"
#include "vdfs/error.h"
#include "vdfs/orchestrator/event_bus.h"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

#include "test_support.h"

using vdfs::orchestrator::ArchiveHandler;
using vdfs_test::Bytes;

namespace {

  std::filesystem::path MakeArchive(const std::filesystem::path& base) {
    const auto archive = base / "Anims.vdf";
    vdfs_test::WriteText(archive / "ANIMS" / "HUMANS.MDS", "humans");
    vdfs_test::WriteText(archive / "ANIMS" / "_COMPILED" / "HUMANS.MSB", "msb");
    vdfs_test::WriteText(archive / "README.TXT", "readme");
    return archive;
  }

  void TestNaming() {
    vdfs_test::TempDir temp("vdfs_handler_name_");
    const auto archive = MakeArchive(temp.path());
    ArchiveHandler mounted(archive);
    assert(mounted.ArchiveName() == "Anims.vdf");
    assert(mounted.IsExistingFile());
    assert(mounted.NodeCount() == 3);

    ArchiveHandler fresh(temp.path() / "new.vdf");
    assert(!fresh.IsExistingFile());
    assert(fresh.NodeCount() == 0);
    assert(fresh.Tree().Root().Children().empty());
    assert(fresh.ArchiveName() == (temp.path() / "new.vdf").string());

    ArchiveHandler unnamed;
    const auto& name = unnamed.ArchiveName();
    assert(name.rfind("Unnamed_", 0) == 0);
    assert(name.size() == std::string("Unnamed_YYYY-MM-DD HH:MM:SS.vdf").size());
    assert(name.substr(name.size() - 4) == ".vdf");
  }

  void TestGameVersion() {
    ArchiveHandler handler;
    assert(handler.Version() == vdfs::vfs::GameVersion::kGothic2);
    handler.SetGameVersion("G1");
    assert(handler.Version() == vdfs::vfs::GameVersion::kGothic1);
    handler.SetGameVersion("g2");
    assert(handler.Version() == vdfs::vfs::GameVersion::kGothic2);
    bool threw = false;
    try {
      handler.SetGameVersion("g3");
    } catch (const vdfs::InvalidGameVersionError& err) {
      threw = std::string(err.what()) == "Invalid game version: g3";
    }
    assert(threw);
    assert(handler.Version() == vdfs::vfs::GameVersion::kGothic2);
  }

  void TestGetFileLogs() {
    ArchiveHandler handler;
    handler.InsertFile(std::string("scripts/gothic.dat"), std::nullopt, Bytes("dat"));
    size_t misses = 0;
    vdfs::orchestrator::EventBus::Instance().Subscribe([&misses](const vdfs::orchestrator::Event& event) {
      if (event.event_id == "handler.get_file" && event.message == "Failed to load") {
        ++misses;
      }
    });
    assert(handler.GetFile("GOTHIC.DAT") != nullptr);
    assert(handler.GetFile("missing") == nullptr);
    assert(misses == 1);
    vdfs::orchestrator::ResetEventBusForTesting();
  }

  void TestSaveAndReload() {
    vdfs_test::TempDir temp("vdfs_handler_save_");
    const auto archive = MakeArchive(temp.path());
    const auto host = temp.path() / "newfile.txt";
    vdfs_test::WriteText(host, "fresh");

    {
      ArchiveHandler handler(archive);
      handler.InsertFile(std::string("anims"), host);
      auto removed = handler.RemoveFile("readme.txt");
      assert(removed.ok && removed.files == 1);
      assert(handler.NodeCount() == 3 && "cached count is not maintained");
      auto saved = handler.Save();
      assert(saved.ok && saved.files == 3);
    }

    ArchiveHandler reloaded(archive);
    assert(reloaded.NodeCount() == 3);
    auto* inserted = reloaded.GetFile("NEWFILE.TXT");
    assert(inserted && inserted->Parent()->Name() == "ANIMS");
    assert(reloaded.GetFile("README.TXT") == nullptr);

    // a destination without '.' is a directory
    const auto out_dir = temp.path() / "out";
    assert(reloaded.ResolveSaveDestination(out_dir) == out_dir / "Anims.vdf");
    assert(reloaded.ResolveSaveDestination({}) == archive);
    assert(reloaded.Save(out_dir).ok);
    ArchiveHandler copy(out_dir / "Anims.vdf");
    assert(copy.NodeCount() == 3);

    // save failures are reported, not thrown
    vdfs_test::WriteText(temp.path() / "blocker", "x");
    auto failed = reloaded.Save(temp.path() / "blocker" / "x.vdf");
    assert(!failed.ok && !failed.error.empty());
  }

  void TestExportThroughHandler() {
    vdfs_test::TempDir temp("vdfs_handler_export_");
    const auto archive = MakeArchive(temp.path());
    ArchiveHandler handler(archive);
    auto report = handler.ExportAll(temp.path() / "unpacked");
    assert(report.ok && report.files == 3);
    assert(vdfs_test::ReadText(temp.path() / "unpacked" / "ANIMS" / "_COMPILED" / "HUMANS.MSB") == "msb");

    report = handler.ExportFile("msb", temp.path() / "flat", true);
    assert(report.ok && report.files == 1);

    bool threw = false;
    try {
      handler.ExportFile("missingname", temp.path() / "x");
    } catch (const vdfs::NodeNotFoundError&) {
      threw = true;
    }
    assert(threw);
  }

  void TestPrintTree() {
    vdfs_test::TempDir temp("vdfs_handler_print_");
    ArchiveHandler handler(MakeArchive(temp.path()));
    std::ostringstream out;
    handler.PrintTree(out);
    const auto text = out.str();
    assert(text.find("├── \x1b[33m[Anims]\x1b[0m\n") != std::string::npos);
    assert(text.find("└── \x1b[32mReadme.Txt\x1b[0m\n") != std::string::npos);
  }

  void TestHostPathsAreHashedInLogs() {
    vdfs_test::TempDir temp("vdfs_handler_privacy_");
    const auto archive = MakeArchive(temp.path());
    ArchiveHandler handler(archive);

    const auto log_path = temp.path() / "logs" / "vdfs.jsonl";
    vdfs::orchestrator::LoggingConfig config;
    config.json_log_path = log_path;
    vdfs::orchestrator::EventBus::Instance().Configure(config);

    const auto out_dir = temp.path() / "private_output";
    assert(handler.ExportAll(out_dir).ok);
    assert(handler.Save(out_dir).ok);
    const auto text = vdfs_test::ReadText(log_path);
    assert(text.find("\"event_id\":\"handler.save\"") != std::string::npos);
    assert(text.find("private_output") == std::string::npos);
    assert(text.find(vdfs::orchestrator::HashForTelemetry(vdfs::PathToUtf8String(out_dir))) !=
           std::string::npos);
    vdfs::orchestrator::ResetEventBusForTesting();
  }

  void TestGetFileByPath() {
    vdfs_test::TempDir temp("vdfs_handler_path_");
    ArchiveHandler handler(MakeArchive(temp.path()));
    auto* compiled = handler.GetFile("anims/_compiled/humans.msb");
    assert(compiled && compiled->Parent()->Name() == "_COMPILED");
    assert(handler.GetFile("ANIMS\\HUMANS.MDS") != nullptr);
    assert(handler.GetFile("_COMPILED/HUMANS.MDS") == nullptr && "resolved from root only");
    assert(handler.GetFile("/") == nullptr);
  }

  void TestRequireArchive() {
    vdfs_test::TempDir temp("vdfs_handler_require_");
    ArchiveHandler mounted(MakeArchive(temp.path()));
    mounted.RequireArchive();

    ArchiveHandler fresh(temp.path() / "new.vdf");
    bool threw = false;
    try {
      fresh.RequireArchive();
    } catch (const vdfs::ArchiveNotLoadedError& err) {
      threw = std::string(err.what()) == fresh.ArchiveName() + " is empty.";
    }
    assert(threw);
  }

  void TestMountRejectsUnreadable() {
    vdfs_test::TempDir temp("vdfs_handler_codec_");
    const auto packed = temp.path() / "packed.vdf";
    vdfs_test::WriteText(packed, "not a directory");
    bool threw = false;
    try {
      ArchiveHandler handler(packed);
    } catch (const vdfs::Error& err) {
      threw = err.code == vdfs::errors::dependency::kCodecUnavailable;
    }
    assert(threw);
  }

} // namespace

int main() {
  TestNaming();
  TestGameVersion();
  TestGetFileLogs();
  TestSaveAndReload();
  TestExportThroughHandler();
  TestPrintTree();
  TestHostPathsAreHashedInLogs();
  TestGetFileByPath();
  TestRequireArchive();
  TestMountRejectsUnreadable();
  std::cout << "archive handler tests ok\n";
  return 0;
}
