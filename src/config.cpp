#include "config.h"

#include <cstdlib>
#include <stdexcept>

namespace pefeat {

static constexpr const char* ENV_FEATURE_VERSION = "PEFEAT_FEATURE_VERSION";
static constexpr const char* ENV_ENTROPY_WINDOW = "PEFEAT_ENTROPY_WINDOW";
static constexpr const char* ENV_ENTROPY_STEP = "PEFEAT_ENTROPY_STEP";

std::optional<std::string> getenv_string(const char* name) {
  const char* v = std::getenv(name);
  if (!v || !*v) {
    return std::nullopt;
  }
  return std::string(v);
}

static std::optional<std::size_t> parse_size_t(const std::string& s) {
  if (s.empty()) return std::nullopt;
  char* end = nullptr;
  unsigned long long v = std::strtoull(s.c_str(), &end, 10);
  if (!end || *end != '\0') return std::nullopt;
  return static_cast<std::size_t>(v);
}

static std::optional<int> parse_int(const std::string& s) {
  if (s.empty()) return std::nullopt;
  char* end = nullptr;
  long v = std::strtol(s.c_str(), &end, 10);
  if (!end || *end != '\0') return std::nullopt;
  return static_cast<int>(v);
}

Config config_from_api(
    int feature_version,
    unsigned int entropy_window,
    unsigned int entropy_step,
    int print_feature_warning) {
  Config cfg;
  if (feature_version > 0) cfg.feature_version = feature_version;
  if (entropy_window > 0) cfg.entropy_window = static_cast<std::size_t>(entropy_window);
  if (entropy_step > 0) cfg.entropy_step = static_cast<std::size_t>(entropy_step);
  if (print_feature_warning >= 0) cfg.print_feature_warning = print_feature_warning != 0;

  if (feature_version <= 0) {
    auto env_version = getenv_string(ENV_FEATURE_VERSION);
    if (env_version) {
      auto v = parse_int(*env_version);
      if (v) cfg.feature_version = *v;
    }
  }

  if (entropy_window == 0) {
    auto env_window = getenv_string(ENV_ENTROPY_WINDOW);
    if (env_window) {
      auto v = parse_size_t(*env_window);
      if (v && *v > 0) cfg.entropy_window = *v;
    }
  }

  if (entropy_step == 0) {
    auto env_step = getenv_string(ENV_ENTROPY_STEP);
    if (env_step) {
      auto v = parse_size_t(*env_step);
      if (v && *v > 0) cfg.entropy_step = *v;
    }
  }

  return cfg;
}

void validate_config(const Config& cfg) {
  if (cfg.feature_version != 1 && cfg.feature_version != 2) {
    throw std::invalid_argument("feature version must be 1 or 2, not " + std::to_string(cfg.feature_version));
  }
  if (cfg.entropy_window == 0) {
    throw std::invalid_argument("byte-entropy window must be greater than zero");
  }
  if (cfg.entropy_step == 0) {
    throw std::invalid_argument("byte-entropy step must be greater than zero");
  }
  if (cfg.limits.max_name_length == 0) {
    throw std::invalid_argument("parser name length limit must be greater than zero");
  }
}

}
