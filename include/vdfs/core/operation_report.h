#pragma once

#include <cstddef>
#include <string>

namespace vdfs::core {

// Outcome of a best-effort operation. files counts the files written or
// removed. A failed operation may still have touched files: nothing is
// rolled back.
struct OperationReport {
  bool ok{true};
  size_t files{0};
  std::string error;
};

}  // namespace vdfs::core
