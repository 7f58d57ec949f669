#include "vdfs/cli/command_line.h"

int main(int argc, char** argv) {
  return vdfs::cli::Main(argc, argv);
}
