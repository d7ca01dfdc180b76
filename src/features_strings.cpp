#include "feature_extractors.h"

#include <cmath>
#include <string_view>

namespace pefeat {

static constexpr std::size_t MIN_STRING_LENGTH = 5;
static constexpr std::size_t PRINTABLE_BINS = 96;

static bool is_printable(std::uint8_t b) {
  return b >= 0x20 && b <= 0x7e;
}

static std::uint8_t lower_byte(std::uint8_t b) {
  return (b >= 'A' && b <= 'Z') ? static_cast<std::uint8_t>(b - 'A' + 'a') : b;
}

// Non-overlapping occurrences; `pattern` must be lower-case when ignore_case.
static std::size_t count_pattern(const std::vector<std::uint8_t>& bytes, std::string_view pattern, bool ignore_case) {
  std::size_t n = bytes.size();
  std::size_t m = pattern.size();
  if (m == 0 || n < m) return 0;
  std::size_t hits = 0;
  std::size_t i = 0;
  while (i + m <= n) {
    std::size_t j = 0;
    for (; j < m; ++j) {
      std::uint8_t b = ignore_case ? lower_byte(bytes[i + j]) : bytes[i + j];
      if (b != static_cast<std::uint8_t>(pattern[j])) break;
    }
    if (j == m) {
      hits++;
      i += m;
    } else {
      i++;
    }
  }
  return hits;
}

nlohmann::json strings_raw(const std::vector<std::uint8_t>& bytes) {
  std::vector<std::uint64_t> dist(PRINTABLE_BINS, 0);
  std::uint64_t numstrings = 0;
  std::uint64_t printables = 0;

  std::size_t run_start = 0;
  std::size_t run_len = 0;
  auto flush = [&]() {
    if (run_len >= MIN_STRING_LENGTH) {
      numstrings++;
      printables += run_len;
      for (std::size_t i = run_start; i < run_start + run_len; ++i) {
        dist[bytes[i] - 0x20]++;
      }
    }
    run_len = 0;
  };

  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (is_printable(bytes[i])) {
      if (run_len == 0) run_start = i;
      run_len++;
    } else {
      flush();
    }
  }
  flush();

  double avlength = 0.0;
  double entropy = 0.0;
  if (numstrings > 0) {
    avlength = static_cast<double>(printables) / static_cast<double>(numstrings);
    double inv = 1.0 / static_cast<double>(printables);
    for (std::uint64_t c : dist) {
      if (c == 0) continue;
      double p = static_cast<double>(c) * inv;
      entropy -= p * std::log2(p);
    }
  }

  nlohmann::json j;
  j["numstrings"] = numstrings;
  j["avlength"] = avlength;
  j["printabledist"] = dist;
  j["printables"] = printables;
  j["entropy"] = entropy;
  j["paths"] = count_pattern(bytes, "c:\\", true);
  j["urls"] = count_pattern(bytes, "http://", true) + count_pattern(bytes, "https://", true);
  j["registry"] = count_pattern(bytes, "HKEY_", false);
  j["MZ"] = count_pattern(bytes, "MZ", false);
  return j;
}

void strings_vector(const nlohmann::json& raw, std::vector<float>& out) {
  double printables = raw.at("printables").get<double>();
  double divisor = printables > 0.0 ? printables : 1.0;

  out.push_back(raw.at("numstrings").get<float>());
  out.push_back(raw.at("avlength").get<float>());
  out.push_back(static_cast<float>(printables));

  auto dist = raw.at("printabledist").get<std::vector<double>>();
  dist.resize(PRINTABLE_BINS, 0.0);
  for (double c : dist) out.push_back(static_cast<float>(c / divisor));

  out.push_back(raw.at("entropy").get<float>());
  out.push_back(raw.at("paths").get<float>());
  out.push_back(raw.at("urls").get<float>());
  out.push_back(raw.at("registry").get<float>());
  out.push_back(raw.at("MZ").get<float>());
}

}
