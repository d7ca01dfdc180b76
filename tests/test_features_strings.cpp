#include <catch2/catch.hpp>

#include "feature_extractors.h"

#include <string>
#include <vector>

using namespace pefeat;

static std::vector<std::uint8_t> to_bytes(const std::string& s) {
  return std::vector<std::uint8_t>(s.begin(), s.end());
}

TEST_CASE("only printable runs of five or more count as strings", "[strings]") {
  auto raw = strings_raw(to_bytes(std::string("hi\0hello\0abcdefg", 16)));
  CHECK(raw["numstrings"].get<int>() == 2);
  CHECK(raw["printables"].get<int>() == 12);
  CHECK(raw["avlength"].get<double>() == Approx(6.0));
}

TEST_CASE("string entropy is over the printable distribution", "[strings]") {
  CHECK(strings_raw(to_bytes("aaaaa"))["entropy"].get<double>() == Approx(0.0));
  CHECK(strings_raw(to_bytes("abababab"))["entropy"].get<double>() == Approx(1.0));
}

TEST_CASE("pattern counts", "[strings]") {
  auto raw = strings_raw(to_bytes("C:\\a c:\\b http://a HTTPS://b HKEY_X hkey_y MZMZ"));
  CHECK(raw["paths"].get<int>() == 2);
  CHECK(raw["urls"].get<int>() == 2);
  CHECK(raw["registry"].get<int>() == 1);
  CHECK(raw["MZ"].get<int>() == 2);
}

TEST_CASE("patterns are found outside of strings too", "[strings]") {
  auto raw = strings_raw(to_bytes(std::string("MZ\0\0", 4)));
  CHECK(raw["numstrings"].get<int>() == 0);
  CHECK(raw["MZ"].get<int>() == 1);
}

TEST_CASE("DEL is not printable", "[strings]") {
  auto raw = strings_raw(to_bytes("abc\x7f" "defgh~~~~~"));
  CHECK(raw["numstrings"].get<int>() == 1);
  CHECK(raw["printabledist"][95].get<int>() == 0);
  CHECK(raw["printabledist"]['~' - 0x20].get<int>() == 5);
}

TEST_CASE("strings vector layout", "[strings]") {
  auto raw = strings_raw(to_bytes("aaaaa bbbbb"));
  std::vector<float> out;
  strings_vector(raw, out);
  REQUIRE(out.size() == STRINGS_DIM);
  CHECK(out[0] == 1.0f);
  CHECK(out[1] == Approx(11.0));
  CHECK(out[2] == Approx(11.0));
  // printable distribution divided by total printables
  CHECK(out[3 + ('a' - 0x20)] == Approx(5.0 / 11.0));
  CHECK(out[3 + 0] == Approx(1.0 / 11.0));

  out.clear();
  strings_vector(strings_raw({}), out);
  REQUIRE(out.size() == STRINGS_DIM);
  for (float v : out) CHECK(v == 0.0f);
}
