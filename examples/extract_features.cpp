#include "pefeat/api.h"

#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

static std::string get_arg_value(int argc, char** argv, const std::string& key) {
  for (int i = 1; i + 1 < argc; ++i) {
    if (argv[i] == key) {
      return std::string(argv[i + 1]);
    }
  }
  return {};
}

static bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

static int usage() {
  std::cerr
      << "Usage:\n"
      << "  pefeat_extract --target <file> [--version <1|2>] [--vector] [--log_level <level>]\n";
  return 2;
}

static bool parse_int(const std::string& s, int& out) {
  if (s.empty()) return false;
  char* end = nullptr;
  long v = std::strtol(s.c_str(), &end, 10);
  if (!end || *end != '\0') return false;
  out = static_cast<int>(v);
  return true;
}

static bool read_file(const std::string& path, std::vector<unsigned char>& out) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
  return !f.bad();
}

int main(int argc, char** argv) {
  if (argc < 3 || has_flag(argc, argv, "--help")) {
    return usage();
  }

  std::string target = get_arg_value(argc, argv, "--target");
  if (target.empty()) {
    return usage();
  }

  std::string level = get_arg_value(argc, argv, "--log_level");
  if (pefeat_init_logging(level.empty() ? nullptr : level.c_str()) != PEFEAT_OK) {
    std::cerr << "unknown log level: " << level << "\n";
    return 2;
  }

  pefeat_config cfg{};
  cfg.print_feature_warning = -1;
  std::string version = get_arg_value(argc, argv, "--version");
  if (!version.empty() && !parse_int(version, cfg.feature_version)) {
    return usage();
  }

  std::vector<unsigned char> bytes;
  if (!read_file(target, bytes)) {
    std::cerr << "cannot read " << target << "\n";
    return 1;
  }

  pefeat_handle* h = pefeat_create(&cfg);
  if (!h) {
    std::cerr << "pefeat_create failed\n";
    return 1;
  }

  int rc = PEFEAT_OK;
  if (has_flag(argc, argv, "--vector")) {
    std::vector<float> vec(pefeat_dim(h));
    rc = pefeat_feature_vector(h, bytes.data(), bytes.size(), vec.data(), vec.size());
    if (rc == PEFEAT_OK) {
      for (std::size_t i = 0; i < vec.size(); ++i) {
        std::cout << (i ? " " : "") << vec[i];
      }
      std::cout << "\n";
    }
  } else {
    char* out_json = nullptr;
    size_t out_len = 0;
    rc = pefeat_raw_features(h, bytes.data(), bytes.size(), &out_json, &out_len);
    if (rc == PEFEAT_OK && out_json) {
      std::cout.write(out_json, static_cast<std::streamsize>(out_len));
      std::cout << "\n";
      pefeat_free(out_json);
    }
  }

  if (rc != PEFEAT_OK) {
    std::cerr << "feature extraction failed: " << rc << "\n";
  }
  pefeat_destroy(h);
  return rc == PEFEAT_OK ? 0 : 1;
}
