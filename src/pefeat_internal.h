#pragma once

#include <cstddef>
#include <cstdint>

namespace pefeat {

struct ParserLimits {
  std::size_t max_sections = 4096;
  std::size_t max_import_libraries = 4096;
  std::size_t max_imports_per_library = 65536;
  std::size_t max_total_imports = 1048576;
  std::size_t max_exports = 1048576;
  std::size_t max_name_length = 10000;
  std::size_t max_data_directories = 16;
  // Section entropy scans at most this many times the buffer size in total.
  std::size_t max_entropy_scan_factor = 2;
};

struct Config {
  int feature_version = 2;
  std::size_t entropy_window = 2048;
  std::size_t entropy_step = 1024;
  bool print_feature_warning = true;
  ParserLimits limits;
};

}
