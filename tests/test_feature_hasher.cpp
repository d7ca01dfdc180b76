#include <catch2/catch.hpp>

#include "feature_hasher.h"

#include <numeric>
#include <stdexcept>
#include <string>

using namespace pefeat;

TEST_CASE("murmurhash3 x86_32 matches reference values", "[hasher]") {
  CHECK(murmurhash3_x86_32("", 0, 0) == 0u);
  CHECK(murmurhash3_x86_32("", 0, 1) == 0x514e28b7u);

  std::string hello = "hello";
  CHECK(murmurhash3_x86_32(hello.data(), hello.size(), 0) == 0x248bfa47u);

  std::string fox = "The quick brown fox jumps over the lazy dog";
  CHECK(murmurhash3_x86_32(fox.data(), fox.size(), 0) == 0x2e4ff723u);
}

TEST_CASE("hash_bucket is the unsigned hash modulo the bucket count", "[hasher]") {
  std::string s = "kernel32.dll";
  std::uint32_t h = murmurhash3_x86_32(s.data(), s.size(), 0);
  CHECK(hash_bucket(s, 256) == h % 256u);
  CHECK(hash_bucket(s, 1) == 0u);
  CHECK(hash_bucket(s, 256) == hash_bucket(s, 256));
}

TEST_CASE("zero buckets is rejected", "[hasher]") {
  CHECK_THROWS_AS(hash_bucket("x", 0), std::invalid_argument);
  CHECK_THROWS_AS(hash_strings({"x"}, 0), std::invalid_argument);
  CHECK_THROWS_AS(hash_pairs({{"x", 1.0}}, 0), std::invalid_argument);
}

TEST_CASE("hash_strings counts duplicates and keeps length", "[hasher]") {
  auto v = hash_strings({"a", "b", "a"}, 16);
  REQUIRE(v.size() == 16);
  CHECK(std::accumulate(v.begin(), v.end(), 0.0f) == 3.0f);
  CHECK(v[hash_bucket("a", 16)] >= 2.0f);

  auto empty = hash_strings({}, 16);
  CHECK(std::accumulate(empty.begin(), empty.end(), 0.0f) == 0.0f);
}

TEST_CASE("hash_pairs adds weights into buckets", "[hasher]") {
  auto v = hash_pairs({{".text", 512.0}, {".text", 0.5}}, 50);
  REQUIRE(v.size() == 50);
  CHECK(v[hash_bucket(".text", 50)] == Approx(512.5));
}
