#include <catch2/catch.hpp>

#include "pefeat/api.h"
#include "pe_fixture.h"

#include <string>
#include <vector>

TEST_CASE("handle lifecycle", "[api]") {
  pefeat_config cfg{};
  cfg.feature_version = 1;
  cfg.print_feature_warning = 0;
  pefeat_handle* h = pefeat_create(&cfg);
  REQUIRE(h != nullptr);
  CHECK(pefeat_dim(h) == 2351);
  pefeat_destroy(h);

  cfg.feature_version = 7;
  CHECK(pefeat_create(&cfg) == nullptr);
  CHECK(pefeat_dim(nullptr) == 0);
  pefeat_destroy(nullptr);
}

TEST_CASE("vectors through the C API", "[api]") {
  pefeat_config cfg{};
  cfg.feature_version = 2;
  cfg.print_feature_warning = 0;
  pefeat_handle* h = pefeat_create(&cfg);
  REQUIRE(h != nullptr);

  auto bytes = pefeat::testing::minimal_pe32();
  std::vector<float> direct(pefeat_dim(h));
  REQUIRE(pefeat_feature_vector(h, bytes.data(), bytes.size(), direct.data(), direct.size()) == PEFEAT_OK);

  char* json = nullptr;
  size_t json_len = 0;
  REQUIRE(pefeat_raw_features(h, bytes.data(), bytes.size(), &json, &json_len) == PEFEAT_OK);
  REQUIRE(json != nullptr);
  CHECK(json[json_len] == '\0');

  std::vector<float> from_raw(pefeat_dim(h));
  CHECK(pefeat_process_raw_features(h, json, json_len, from_raw.data(), from_raw.size()) == PEFEAT_OK);
  CHECK(from_raw == direct);
  pefeat_free(json);

  std::vector<float> small(10);
  CHECK(pefeat_feature_vector(h, bytes.data(), bytes.size(), small.data(), small.size()) ==
        PEFEAT_ERR_BUFFER_TOO_SMALL);
  CHECK(pefeat_feature_vector(h, nullptr, 0, direct.data(), direct.size()) == PEFEAT_OK);
  CHECK(pefeat_feature_vector(h, nullptr, 5, direct.data(), direct.size()) == PEFEAT_ERR_INVALID_ARGUMENT);

  std::string not_json = "not json";
  CHECK(pefeat_process_raw_features(h, not_json.data(), not_json.size(), direct.data(), direct.size()) ==
        PEFEAT_ERR_BAD_RECORD);
  std::string empty_record = "{}";
  CHECK(pefeat_process_raw_features(h, empty_record.data(), empty_record.size(), direct.data(), direct.size()) ==
        PEFEAT_ERR_BAD_RECORD);

  pefeat_destroy(h);
}

TEST_CASE("log level names", "[api]") {
  CHECK(pefeat_init_logging("bogus") == PEFEAT_ERR_INVALID_ARGUMENT);
  CHECK(pefeat_init_logging("off") == PEFEAT_OK);
  CHECK(pefeat_init_logging("warn") == PEFEAT_OK);
}

TEST_CASE("raw record for a PE with a non UTF-8 section name", "[api]") {
  pefeat_config cfg{};
  cfg.print_feature_warning = 0;
  cfg.feature_version = 2;
  pefeat_handle* h = pefeat_create(&cfg);
  REQUIRE(h != nullptr);

  pefeat::testing::PeFixtureOptions options;
  options.text_name = "\xFF\xFEtext";
  auto bytes = pefeat::testing::build_pe32(options);

  char* json = nullptr;
  size_t json_len = 0;
  REQUIRE(pefeat_raw_features(h, bytes.data(), bytes.size(), &json, &json_len) == PEFEAT_OK);
  std::vector<float> from_raw(pefeat_dim(h));
  CHECK(pefeat_process_raw_features(h, json, json_len, from_raw.data(), from_raw.size()) == PEFEAT_OK);
  pefeat_free(json);

  std::vector<float> direct(pefeat_dim(h));
  REQUIRE(pefeat_feature_vector(h, bytes.data(), bytes.size(), direct.data(), direct.size()) == PEFEAT_OK);
  CHECK(from_raw == direct);
  pefeat_destroy(h);
}
