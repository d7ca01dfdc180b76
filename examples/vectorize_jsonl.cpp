#include "extractor.h"
#include "logging.h"
#include "postprocess.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
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
      << "  pefeat_vectorize --input <features.jsonl> --output <dir> [--version <1|2>] [--no_log_transform]\n"
      << "Writes X.dat (float32 rows), y.dat (float32 labels) and S.txt (sha256 per row).\n";
  return 2;
}

static float label_of(const nlohmann::json& record) {
  auto it = record.find("label");
  if (it == record.end() || !it->is_number()) return 0.0f;
  return it->get<float>();
}

static std::string sha256_of(const nlohmann::json& record) {
  auto it = record.find("sha256");
  if (it == record.end() || !it->is_string()) return {};
  return it->get<std::string>();
}

int main(int argc, char** argv) {
  if (argc < 5 || has_flag(argc, argv, "--help")) {
    return usage();
  }

  std::string input = get_arg_value(argc, argv, "--input");
  std::string output = get_arg_value(argc, argv, "--output");
  if (input.empty() || output.empty()) {
    return usage();
  }

  pefeat::init_logging(spdlog::level::info);

  int version = 2;
  std::string version_arg = get_arg_value(argc, argv, "--version");
  if (!version_arg.empty()) {
    version = std::atoi(version_arg.c_str());
  }
  bool log_transform = !has_flag(argc, argv, "--no_log_transform");

  std::unique_ptr<pefeat::PeFeatureExtractor> extractor;
  try {
    extractor = std::make_unique<pefeat::PeFeatureExtractor>(version);
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  std::ifstream in(input);
  if (!in) {
    std::cerr << "cannot open " << input << "\n";
    return 1;
  }

  std::error_code ec;
  std::filesystem::create_directories(output, ec);
  if (ec) {
    std::cerr << "cannot create " << output << ": " << ec.message() << "\n";
    return 1;
  }
  std::filesystem::path out_dir(output);
  std::ofstream x_out(out_dir / "X.dat", std::ios::binary);
  std::ofstream y_out(out_dir / "y.dat", std::ios::binary);
  std::ofstream s_out(out_dir / "S.txt");
  if (!x_out || !y_out || !s_out) {
    std::cerr << "cannot write to " << output << "\n";
    return 1;
  }

  const std::size_t dim = extractor->dim();
  std::size_t rows = 0;
  std::size_t failed = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;

    std::vector<float> row(dim, 0.0f);
    float label = 0.0f;
    std::string sha256;
    try {
      nlohmann::json record = nlohmann::json::parse(line);
      label = label_of(record);
      sha256 = sha256_of(record);
      row = extractor->process_raw_features(record);
      if (log_transform) pefeat::log_transform_inplace(row);
    } catch (const nlohmann::json::exception& e) {
      pefeat::logger()->warn("line {}: {}", rows + 1, e.what());
      ++failed;
    } catch (const std::invalid_argument& e) {
      pefeat::logger()->warn("line {}: {}", rows + 1, e.what());
      row.assign(dim, 0.0f);
      ++failed;
    }

    x_out.write(reinterpret_cast<const char*>(row.data()), static_cast<std::streamsize>(dim * sizeof(float)));
    y_out.write(reinterpret_cast<const char*>(&label), sizeof(float));
    s_out << sha256 << "\n";
    ++rows;
  }

  if (!x_out || !y_out || !s_out) {
    std::cerr << "write to " << output << " failed\n";
    return 1;
  }

  pefeat::logger()->info("vectorized {} rows of dim {} ({} failed)", rows, dim, failed);
  return 0;
}
