#include "feature_extractors.h"

#include <cmath>

namespace pefeat {

static void append_normalized(const std::vector<std::uint64_t>& counts, std::vector<float>& out) {
  double total = 0.0;
  for (std::uint64_t c : counts) total += static_cast<double>(c);
  for (std::uint64_t c : counts) {
    out.push_back(total > 0.0 ? static_cast<float>(static_cast<double>(c) / total) : 0.0f);
  }
}

nlohmann::json byte_histogram_raw(const std::vector<std::uint8_t>& bytes) {
  std::vector<std::uint64_t> counts(256, 0);
  for (std::uint8_t b : bytes) counts[b]++;
  return counts;
}

void byte_histogram_vector(const nlohmann::json& raw, std::vector<float>& out) {
  auto counts = raw.get<std::vector<std::uint64_t>>();
  counts.resize(BYTE_HISTOGRAM_DIM, 0);
  append_normalized(counts, out);
}

std::size_t entropy_bin(const std::array<std::uint64_t, 16>& coarse, std::size_t window) {
  if (window == 0) return 0;
  double inv = 1.0 / static_cast<double>(window);
  double h = 0.0;
  for (std::uint64_t c : coarse) {
    if (c == 0) continue;
    double p = static_cast<double>(c) * inv;
    h -= p * std::log2(p);
  }
  // 16-bin entropy peaks at 4 bits; x2 puts it on the 0..8 byte-entropy scale.
  h *= 2.0;
  double scaled = std::floor(h * 2.0);
  if (!(scaled > 0.0)) return 0;
  if (scaled >= 15.0) return 15;
  return static_cast<std::size_t>(scaled);
}

nlohmann::json byte_entropy_raw(const std::vector<std::uint8_t>& bytes, std::size_t window, std::size_t step) {
  std::vector<std::uint64_t> grid(256, 0);

  // Probabilities divide by the window size, also for a buffer shorter than
  // the window.
  auto accumulate_block = [&](std::size_t start, std::size_t len) {
    std::array<std::uint64_t, 16> coarse{};
    for (std::size_t i = start; i < start + len; ++i) {
      coarse[bytes[i] >> 4]++;
    }
    std::size_t row = entropy_bin(coarse, window);
    for (std::size_t j = 0; j < 16; ++j) {
      grid[row * 16 + j] += coarse[j];
    }
  };

  std::size_t n = bytes.size();
  if (n < window) {
    accumulate_block(0, n);
  } else {
    for (std::size_t off = 0; n - off >= window; off += step) {
      accumulate_block(off, window);
      if (n - off < step) break;
    }
  }
  return grid;
}

void byte_entropy_vector(const nlohmann::json& raw, std::vector<float>& out) {
  auto counts = raw.get<std::vector<std::uint64_t>>();
  counts.resize(BYTE_ENTROPY_DIM, 0);
  append_normalized(counts, out);
}

}
