#include "vdfs/cli/command_line.h"
#include "vdfs/error.h"
#include "vdfs/orchestrator/archive_handler.h"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "test_support.h"

using vdfs::cli::CliOptions;
using vdfs::cli::kExitIO;
using vdfs::cli::kExitOk;
using vdfs::cli::kExitUsage;

namespace {

  int RunCommand(const std::vector<std::string>& args, std::ostream& out) {
    std::vector<const char*> argv{"vdfs"};
    for (const auto& arg : args) {
      argv.push_back(arg.c_str());
    }
    std::ostringstream err;
    return vdfs::cli::Main(static_cast<int>(argv.size()), argv.data(), out, err);
  }

  void TestWildcardFilter() {
    assert(vdfs::cli::WildcardFilter("*tex") == "tex");
    assert(vdfs::cli::WildcardFilter("textures/*wall") == "wall");
    assert(vdfs::cli::WildcardFilter("*tex*ignored") == "tex");
    assert(vdfs::cli::WildcardFilter("*").empty());
    assert(vdfs::cli::WildcardFilter("HUMANS.MDS") == "HUMANS.MDS");

    assert(vdfs::cli::HasVdfExtension("Anims.vdf"));
    assert(vdfs::cli::HasVdfExtension("ANIMS.VDF"));
    assert(!vdfs::cli::HasVdfExtension("anims.zip"));
    assert(!vdfs::cli::HasVdfExtension("vdf"));
  }

  void TestParseArguments() {
    const char* argv[] = {"vdfs", "Anims.vdf", "-a", "src", "anims/_compiled", "-o", "out",
                          "--game=g1", "-v", "-d"};
    CliOptions options;
    assert(vdfs::cli::ParseArguments(10, argv, options));
    assert(options.archive == "Anims.vdf");
    assert(options.add && options.add->first == "src" && options.add->second == "anims/_compiled");
    assert(options.output_path == "out");
    assert(options.game && *options.game == "g1");
    assert(options.view && options.debug && !options.full_debug);

    const char* missing_value[] = {"vdfs", "Anims.vdf", "-e"};
    CliOptions partial;
    assert(!vdfs::cli::ParseArguments(3, missing_value, partial));

    const char* no_archive[] = {"vdfs", "-v"};
    CliOptions empty;
    assert(!vdfs::cli::ParseArguments(2, no_archive, empty));
  }

  void TestExitCodes() {
    assert(vdfs::cli::ExitCodeFor(vdfs::InvalidGameVersionError("g3")) == kExitUsage);
    assert(vdfs::cli::ExitCodeFor(vdfs::NodeNotFoundError("x")) == kExitIO);
    assert(vdfs::cli::ExitCodeFor(vdfs::ArchiveNotLoadedError("x")) == kExitIO);

    std::ostringstream out;
    assert(RunCommand({}, out) == kExitUsage);
    assert(RunCommand({"-h"}, out) == kExitUsage);
  }

  void TestArchivePathChecks() {
    vdfs_test::TempDir temp("vdfs_cli_paths_");
    std::ostringstream out;
    assert(RunCommand({(temp.path() / "anims.zip").string(), "-v"}, out) == kExitUsage);
    assert(out.str().find("is not a valid VDF archive.") != std::string::npos);

    std::ostringstream missing;
    assert(RunCommand({(temp.path() / "missing.vdf").string(), "-v"}, missing) == kExitUsage);

    // -a may start a new archive, but there is nothing to view yet
    vdfs_test::WriteText(temp.path() / "src.txt", "x");
    const auto fresh = temp.path() / "fresh.vdf";
    std::ostringstream empty;
    assert(RunCommand({fresh.string(), "-a", (temp.path() / "src.txt").string(), ".", "-v"}, empty) ==
           kExitIO);
    assert(empty.str().find(fresh.string() + " is empty.") != std::string::npos);
    assert(!std::filesystem::exists(fresh));

    std::ostringstream bad_version;
    assert(RunCommand({fresh.string(), "-a", (temp.path() / "src.txt").string(), ".", "--game=g3"},
                      bad_version) == kExitUsage);
  }

  void TestAddWildcardAndView() {
    vdfs_test::TempDir temp("vdfs_cli_add_");
    const auto textures = temp.path() / "textures";
    vdfs_test::WriteText(textures / "wall_a.tex", "a");
    vdfs_test::WriteText(textures / "WALL_B.TEX", "b");
    vdfs_test::WriteText(textures / "floor.tex", "f");
    const auto archive = temp.path() / "Textures.vdf";

    std::ostringstream out;
    assert(RunCommand({archive.string(), "-a", (textures / "*wall").string(), "_work/data"}, out) ==
           kExitOk);
    {
      vdfs::orchestrator::ArchiveHandler handler(archive);
      assert(handler.NodeCount() == 2);
      auto* wall = handler.GetFile("_work/data/WALL_A.TEX");
      assert(wall && std::string(wall->Data().begin(), wall->Data().end()) == "a");
      assert(handler.GetFile("FLOOR.TEX") == nullptr);
    }

    std::ostringstream missing_dir;
    assert(RunCommand({archive.string(), "-a", (temp.path() / "nope" / "*wall").string(), "."},
                      missing_dir) == kExitIO);
    assert(missing_dir.str().find("was not found.") != std::string::npos);

    std::ostringstream view;
    assert(RunCommand({archive.string(), "-v"}, view) == kExitOk);
    assert(view.str().find("[_Work]") != std::string::npos);
    assert(view.str().find("Wall_A.Tex") != std::string::npos);
  }

  void TestExtractAndRemove() {
    vdfs_test::TempDir temp("vdfs_cli_extract_");
    const auto archive = temp.path() / "Anims.vdf";
    vdfs_test::WriteText(archive / "ANIMS" / "HUMANS.MDS", "humans");
    vdfs_test::WriteText(archive / "ANIMS" / "ORC.MDS", "orc");
    vdfs_test::WriteText(archive / "README.TXT", "readme");

    std::ostringstream out;
    const auto flat = temp.path() / "flat";
    assert(RunCommand({archive.string(), "-e", "*mds", "-o", flat.string()}, out) == kExitOk);
    assert(vdfs_test::CountHostFiles(flat) == 2);

    std::ostringstream missing;
    assert(RunCommand({archive.string(), "-e", "nothing", "-o", flat.string()}, missing) == kExitIO);

    assert(RunCommand({archive.string(), "-r", "*orc"}, out) == kExitOk);
    vdfs::orchestrator::ArchiveHandler handler(archive);
    assert(handler.NodeCount() == 2);
    assert(handler.GetFile("ORC.MDS") == nullptr);
  }

} // namespace

int main() {
  TestWildcardFilter();
  TestParseArguments();
  TestExitCodes();
  TestArchivePathChecks();
  TestAddWildcardAndView();
  TestExtractAndRemove();
  std::cout << "command line tests ok\n";
  return 0;
}
