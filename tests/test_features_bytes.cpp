#include <catch2/catch.hpp>

#include "feature_extractors.h"

#include <cstdint>
#include <numeric>
#include <random>
#include <vector>

using namespace pefeat;

static std::uint64_t grid_total(const nlohmann::json& raw) {
  std::uint64_t total = 0;
  for (const auto& c : raw) total += c.get<std::uint64_t>();
  return total;
}

TEST_CASE("byte histogram normalizes to one", "[bytes]") {
  std::vector<std::uint8_t> bytes = {0, 0, 1, 255};
  auto raw = byte_histogram_raw(bytes);
  REQUIRE(raw.size() == 256);
  CHECK(raw[0].get<int>() == 2);
  CHECK(raw[255].get<int>() == 1);

  std::vector<float> out;
  byte_histogram_vector(raw, out);
  REQUIRE(out.size() == BYTE_HISTOGRAM_DIM);
  CHECK(out[0] == Approx(0.5));
  CHECK(out[1] == Approx(0.25));
  CHECK(std::accumulate(out.begin(), out.end(), 0.0) == Approx(1.0));
}

TEST_CASE("empty input gives an all-zero histogram", "[bytes]") {
  std::vector<float> out;
  byte_histogram_vector(byte_histogram_raw({}), out);
  REQUIRE(out.size() == BYTE_HISTOGRAM_DIM);
  for (float v : out) CHECK(v == 0.0f);

  out.clear();
  byte_entropy_vector(byte_entropy_raw({}, 2048, 1024), out);
  REQUIRE(out.size() == BYTE_ENTROPY_DIM);
  for (float v : out) CHECK(v == 0.0f);
}

TEST_CASE("entropy bin stays within 0..15", "[bytes]") {
  std::array<std::uint64_t, 16> uniform{};
  uniform.fill(128);
  CHECK(entropy_bin(uniform, 2048) == 15);

  std::array<std::uint64_t, 16> constant{};
  constant[3] = 2048;
  CHECK(entropy_bin(constant, 2048) == 0);

  // one bit over 16 bins -> 2 on the 0..8 scale -> bin 4
  std::array<std::uint64_t, 16> halves{};
  halves[0] = 1024;
  halves[15] = 1024;
  CHECK(entropy_bin(halves, 2048) == 4);

  CHECK(entropy_bin(constant, 0) == 0);

  std::mt19937 rng(7);
  for (int i = 0; i < 200; ++i) {
    std::array<std::uint64_t, 16> coarse{};
    std::size_t len = 1 + rng() % 4096;
    for (std::size_t k = 0; k < len; ++k) coarse[rng() % 16]++;
    CHECK(entropy_bin(coarse, len) <= 15);
  }
}

TEST_CASE("byte entropy slides the window by the step", "[bytes]") {
  std::vector<std::uint8_t> bytes(4096);
  for (std::size_t i = 0; i < bytes.size(); ++i) bytes[i] = static_cast<std::uint8_t>(i * 31);

  // windows at 0, 1024, 2048
  CHECK(grid_total(byte_entropy_raw(bytes, 2048, 1024)) == 3u * 2048u);

  // a buffer shorter than the window is a single block
  std::vector<std::uint8_t> small(100, 0x41);
  auto raw = byte_entropy_raw(small, 2048, 1024);
  CHECK(grid_total(raw) == 100u);
  // constant data: entropy row 0, high nibble 4
  CHECK(raw[4].get<std::uint64_t>() == 100u);
}

TEST_CASE("byte entropy vector sums to one for non-empty input", "[bytes]") {
  std::vector<std::uint8_t> bytes(5000);
  std::mt19937 rng(1);
  for (auto& b : bytes) b = static_cast<std::uint8_t>(rng());

  std::vector<float> out;
  byte_entropy_vector(byte_entropy_raw(bytes, 2048, 1024), out);
  REQUIRE(out.size() == BYTE_ENTROPY_DIM);
  CHECK(std::accumulate(out.begin(), out.end(), 0.0) == Approx(1.0));
  // random bytes land in the top entropy rows
  double top = std::accumulate(out.begin() + 14 * 16, out.end(), 0.0);
  CHECK(top == Approx(1.0));
}

TEST_CASE("short buffers take probabilities over the whole window", "[bytes]") {
  // 96 bytes spread evenly over all 16 high nibbles: 4 bits over the block,
  // but with p = 6 / 2048 the doubled entropy is about 0.79 -> row 1
  std::vector<std::uint8_t> bytes(96);
  for (std::size_t i = 0; i < bytes.size(); ++i) bytes[i] = static_cast<std::uint8_t>((i % 16) << 4);

  auto raw = byte_entropy_raw(bytes, 2048, 1024);
  CHECK(grid_total(raw) == 96u);
  for (std::size_t j = 0; j < 16; ++j) {
    CHECK(raw[16 + j].get<std::uint64_t>() == 6u);
  }

  std::array<std::uint64_t, 16> coarse{};
  coarse.fill(6);
  CHECK(entropy_bin(coarse, 2048) == 1);
  CHECK(entropy_bin(coarse, 96) == 15);
}
