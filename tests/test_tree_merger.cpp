#include "vdfs/core/tree_merger.h"
#include "vdfs/error.h"
#include "vdfs/vfs/vfs.h"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include "test_support.h"

using vdfs::core::NameCase;
using vdfs::core::TreeMerger;
using vdfs_test::Bytes;

namespace {

  size_t CountDirectories(const vdfs::vfs::VfsNode& node) {
    size_t dirs = 0;
    for (const auto& child : node.Children()) {
      if (child->IsDirectory()) {
        dirs += 1 + CountDirectories(*child);
      }
    }
    return dirs;
  }

  void SeedSource(const std::filesystem::path& src) {
    vdfs_test::WriteText(src / "x.txt", "payload-x");
    vdfs_test::WriteText(src / "sub" / "y.txt", "payload-y");
  }

  // "dir{child,child}" with files bare, in creation order.
  std::string Shape(const vdfs::vfs::VfsNode& node) {
    std::string out = node.Name();
    if (!node.IsDirectory()) {
      return out;
    }
    out += "{";
    for (size_t i = 0; i < node.Children().size(); ++i) {
      out += (i ? "," : "") + Shape(*node.Children()[i]);
    }
    return out + "}";
  }

  void TestInsertContent() {
    vdfs::vfs::Vfs vfs;
    TreeMerger merger(vfs.Root());
    auto* file = merger.InsertFile(std::string("a/b/file.txt"), std::nullopt, Bytes("X"));
    assert(file && !file->IsDirectory());
    assert(Shape(vfs.Root()) == "{a{b{FILE.TXT}}}");
    auto* a = vfs.Root().GetChild("a");
    auto* b = a->GetChild("b");
    assert(b && b->IsDirectory());
    assert(b->GetChild("FILE.TXT") == file);
    assert(file->Data().size() == 1 && file->Data()[0] == 'X');

    // no separator: straight under root
    auto* top = merger.InsertFile(std::string("readme.md"), std::nullopt, Bytes("r"));
    assert(top->Parent() == &vfs.Root());
    assert(top->Name() == "README.MD");

    // duplicate file nodes are a known limitation
    merger.InsertFile(std::string("A/B/file.txt"), std::nullopt, Bytes("Y"));
    assert(b->Children().size() == 2);
    assert(Shape(vfs.Root()) == "{a{b{FILE.TXT,FILE.TXT}},README.MD}");
  }

  void TestInsertContentCasing() {
    vdfs::vfs::Vfs upper_vfs;
    TreeMerger(upper_vfs.Root(), NameCase::kUpper)
        .InsertFile(std::string("a/b/file.txt"), std::nullopt, Bytes("X"));
    assert(Shape(upper_vfs.Root()) == "{A{B{FILE.TXT}}}");

    vdfs::vfs::Vfs kept_vfs;
    TreeMerger(kept_vfs.Root(), NameCase::kPreserve)
        .InsertFile(std::string("a/b/file.txt"), std::nullopt, Bytes("X"));
    assert(Shape(kept_vfs.Root()) == "{a{b{file.txt}}}");
  }

  void TestInsertDirectoryOnly() {
    vdfs::vfs::Vfs vfs;
    TreeMerger merger(vfs.Root());
    auto* dir = merger.InsertFile(std::string("worlds/newworld"), std::nullopt);
    assert(dir && dir->IsDirectory());
    assert(dir->Name() == "newworld");
    assert(merger.InsertFile(std::string("WORLDS/NEWWORLD"), std::nullopt) == dir);
    assert(CountDirectories(vfs.Root()) == 2);
  }

  void TestInvalidData() {
    vdfs::vfs::Vfs vfs;
    TreeMerger merger(vfs.Root());
    bool threw = false;
    try {
      merger.InsertFile(std::nullopt, std::nullopt);
    } catch (const vdfs::InvalidDataError&) {
      threw = true;
    }
    assert(threw && "no source and no internal path");

    threw = false;
    try {
      merger.InsertFile(std::string("a/file.txt"), std::nullopt);
    } catch (const vdfs::InvalidDataError&) {
      threw = true;
    }
    assert(threw && "extension without content or source");
    assert(vfs.Root().Children().empty());
  }

  void TestMergeHostDirectory(NameCase name_case) {
    vdfs_test::TempDir temp("vdfs_merge_");
    const auto src = temp.path() / "src";
    SeedSource(src);

    vdfs::vfs::Vfs vfs;
    TreeMerger merger(vfs.Root(), name_case);
    auto* merged = merger.InsertFile(std::nullopt, src);
    const bool upper = name_case == NameCase::kUpper;

    assert(merged && merged->IsDirectory());
    assert(Shape(vfs.Root()) == (upper ? "{SRC{SUB{Y.TXT},X.TXT}}" : "{src{sub{y.txt},x.txt}}"));
    auto* y = merged->GetChild("sub")->GetChild("y.txt");
    assert(y && std::string(y->Data().begin(), y->Data().end()) == "payload-y");
    assert(vfs.CountFiles() == 2);

    // a second merge reuses directories
    merger.InsertFile(std::string("."), src);
    assert(CountDirectories(vfs.Root()) == 2);
    assert(vfs.CountFiles() == 4);
  }

  void TestMergeIntoInternalPath() {
    vdfs_test::TempDir temp("vdfs_merge_target_");
    const auto src = temp.path() / "src";
    SeedSource(src);

    vdfs::vfs::Vfs vfs;
    TreeMerger merger(vfs.Root());
    auto& shadow = vfs.Root().CreateDirectory("SRC");
    auto* merged = merger.InsertFile(std::string("data/scripts"), src);
    assert(merged != &shadow && "lookup is scoped to the target directory");
    assert(merged->Name() == "src");
    assert(merged->Parent()->Name() == "scripts");
    assert(merged->Parent()->Parent()->Name() == "data");
    assert(shadow.Children().empty());
  }

  void TestInsertHostFile() {
    vdfs_test::TempDir temp("vdfs_insert_file_");
    const auto host = temp.path() / "Hero.3ds";
    vdfs_test::WriteText(host, "mesh");

    vdfs::vfs::Vfs vfs;
    TreeMerger merger(vfs.Root());
    for (const char* root_path : {"", ".", "/", "\\", "./", ".\\"}) {
      auto* node = merger.InsertFile(std::string(root_path), host);
      assert(node->Parent() == &vfs.Root());
      assert(node->Name() == "HERO.3DS");
    }
    auto* node = merger.InsertFile(std::nullopt, host);
    assert(node->Parent() == &vfs.Root());

    auto* nested = merger.InsertFile(std::string("meshes/_compiled"), host);
    assert(nested->Name() == "HERO.3DS");
    assert(nested->Parent()->Name() == "_compiled");
    assert(std::string(nested->Data().begin(), nested->Data().end()) == "mesh");

    TreeMerger preserving(vfs.Root(), NameCase::kPreserve);
    auto* kept = preserving.InsertFile(std::string("Meshes"), host);
    assert(kept->Name() == "Hero.3ds");
    assert(kept->Parent()->Name() == "meshes" && "existing directory is reused");

    TreeMerger upper(vfs.Root(), NameCase::kUpper);
    auto* shouted = upper.InsertFile(std::string("anims/_compiled"), host);
    assert(shouted->Name() == "HERO.3DS");
    assert(shouted->Parent()->Name() == "_COMPILED");
    assert(shouted->Parent()->Parent()->Name() == "ANIMS");

    bool threw = false;
    try {
      merger.InsertFile(std::string("x"), temp.path() / "missing.bin");
    } catch (const vdfs::Error& err) {
      threw = err.domain == vdfs::ErrorDomain::IO;
    }
    assert(threw);
  }

} // namespace

int main() {
  TestInsertContent();
  TestInsertContentCasing();
  TestInsertDirectoryOnly();
  TestInvalidData();
  TestMergeHostDirectory(NameCase::kArchive);
  TestMergeHostDirectory(NameCase::kUpper);
  TestMergeHostDirectory(NameCase::kPreserve);
  TestMergeIntoInternalPath();
  TestInsertHostFile();
  std::cout << "tree merger tests ok\n";
  return 0;
}
