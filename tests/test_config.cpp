#include <catch2/catch.hpp>

#include "config.h"
#include "sha256.h"

#include <stdexcept>
#include <stdlib.h>

using namespace pefeat;

TEST_CASE("zero API values fall back to the environment, then defaults", "[config]") {
  unsetenv("PEFEAT_FEATURE_VERSION");
  unsetenv("PEFEAT_ENTROPY_WINDOW");
  unsetenv("PEFEAT_ENTROPY_STEP");

  Config defaults = config_from_api(0, 0, 0, -1);
  CHECK(defaults.feature_version == 2);
  CHECK(defaults.entropy_window == 2048);
  CHECK(defaults.entropy_step == 1024);
  CHECK(defaults.print_feature_warning);

  setenv("PEFEAT_FEATURE_VERSION", "1", 1);
  setenv("PEFEAT_ENTROPY_WINDOW", "4096", 1);
  setenv("PEFEAT_ENTROPY_STEP", "nonsense", 1);
  Config from_env = config_from_api(0, 0, 0, 0);
  CHECK(from_env.feature_version == 1);
  CHECK(from_env.entropy_window == 4096);
  CHECK(from_env.entropy_step == 1024);
  CHECK_FALSE(from_env.print_feature_warning);

  Config explicit_values = config_from_api(2, 512, 256, 1);
  CHECK(explicit_values.feature_version == 2);
  CHECK(explicit_values.entropy_window == 512);
  CHECK(explicit_values.entropy_step == 256);

  unsetenv("PEFEAT_FEATURE_VERSION");
  unsetenv("PEFEAT_ENTROPY_WINDOW");
  unsetenv("PEFEAT_ENTROPY_STEP");
}

TEST_CASE("invalid configuration throws", "[config]") {
  Config cfg;
  CHECK_NOTHROW(validate_config(cfg));

  cfg.feature_version = 3;
  CHECK_THROWS_AS(validate_config(cfg), std::invalid_argument);

  cfg = Config{};
  cfg.entropy_window = 0;
  CHECK_THROWS_AS(validate_config(cfg), std::invalid_argument);

  cfg = Config{};
  cfg.limits.max_name_length = 0;
  CHECK_THROWS_AS(validate_config(cfg), std::invalid_argument);
}

TEST_CASE("sha256 hex digest", "[sha256]") {
  CHECK(sha256_hex({}) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  CHECK(sha256_hex({'a', 'b', 'c'}) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}
