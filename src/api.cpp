#include "pefeat/api.h"

#include "config.h"
#include "extractor.h"
#include "logging.h"

#include <cstdlib>
#include <cstring>
#include <new>
#include <stdexcept>

#include <nlohmann/json.hpp>

struct pefeat_handle {
  pefeat::PeFeatureExtractor extractor;
};

pefeat_handle* pefeat_create(const pefeat_config* config) {
  pefeat::Config cfg = config
      ? pefeat::config_from_api(
            config->feature_version,
            config->entropy_window,
            config->entropy_step,
            config->print_feature_warning)
      : pefeat::config_from_api(0, 0, 0, -1);

  try {
    return new (std::nothrow) pefeat_handle{pefeat::PeFeatureExtractor(cfg)};
  } catch (const std::exception& e) {
    pefeat::logger()->error("pefeat_create: {}", e.what());
    return nullptr;
  }
}

void pefeat_destroy(pefeat_handle* handle) {
  delete handle;
}

size_t pefeat_dim(const pefeat_handle* handle) {
  return handle ? handle->extractor.dim() : 0;
}

static int write_json_out(const nlohmann::json& j, char** out_json, size_t* out_len) {
  std::string s = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  char* buf = static_cast<char*>(std::malloc(s.size() + 1));
  if (!buf) {
    return PEFEAT_ERR_OOM;
  }
  std::memcpy(buf, s.data(), s.size());
  buf[s.size()] = '\0';
  *out_json = buf;
  *out_len = s.size();
  return PEFEAT_OK;
}

static int write_vector_out(const std::vector<float>& v, float* out, size_t out_capacity) {
  if (out_capacity < v.size()) {
    return PEFEAT_ERR_BUFFER_TOO_SMALL;
  }
  std::memcpy(out, v.data(), v.size() * sizeof(float));
  return PEFEAT_OK;
}

int pefeat_raw_features(
    const pefeat_handle* handle, const unsigned char* bytes, size_t len, char** out_json, size_t* out_len) {
  if (!handle || (!bytes && len > 0) || !out_json || !out_len) {
    return PEFEAT_ERR_INVALID_ARGUMENT;
  }
  try {
    std::vector<std::uint8_t> v(bytes, bytes + len);
    return write_json_out(handle->extractor.raw_features(v), out_json, out_len);
  } catch (const std::bad_alloc&) {
    pefeat::logger()->error("pefeat_raw_features: out of memory");
    return PEFEAT_ERR_OOM;
  } catch (const std::exception& e) {
    pefeat::logger()->error("pefeat_raw_features: {}", e.what());
    return PEFEAT_ERR_INVALID_ARGUMENT;
  }
}

int pefeat_feature_vector(
    const pefeat_handle* handle, const unsigned char* bytes, size_t len, float* out, size_t out_capacity) {
  if (!handle || (!bytes && len > 0) || !out) {
    return PEFEAT_ERR_INVALID_ARGUMENT;
  }
  if (out_capacity < handle->extractor.dim()) {
    return PEFEAT_ERR_BUFFER_TOO_SMALL;
  }
  try {
    std::vector<std::uint8_t> v(bytes, bytes + len);
    return write_vector_out(handle->extractor.feature_vector(v), out, out_capacity);
  } catch (const std::bad_alloc&) {
    pefeat::logger()->error("pefeat_feature_vector: out of memory");
    return PEFEAT_ERR_OOM;
  } catch (const std::exception& e) {
    pefeat::logger()->error("pefeat_feature_vector: {}", e.what());
    return PEFEAT_ERR_INVALID_ARGUMENT;
  }
}

int pefeat_process_raw_features(
    const pefeat_handle* handle, const char* raw_json, size_t raw_len, float* out, size_t out_capacity) {
  if (!handle || !raw_json || !out) {
    return PEFEAT_ERR_INVALID_ARGUMENT;
  }
  if (out_capacity < handle->extractor.dim()) {
    return PEFEAT_ERR_BUFFER_TOO_SMALL;
  }
  try {
    nlohmann::json raw = nlohmann::json::parse(raw_json, raw_json + raw_len);
    return write_vector_out(handle->extractor.process_raw_features(raw), out, out_capacity);
  } catch (const std::bad_alloc&) {
    pefeat::logger()->error("pefeat_process_raw_features: out of memory");
    return PEFEAT_ERR_OOM;
  } catch (const nlohmann::json::exception& e) {
    pefeat::logger()->error("pefeat_process_raw_features: {}", e.what());
    return PEFEAT_ERR_BAD_RECORD;
  } catch (const std::invalid_argument& e) {
    pefeat::logger()->error("pefeat_process_raw_features: {}", e.what());
    return PEFEAT_ERR_BAD_RECORD;
  } catch (const std::exception& e) {
    pefeat::logger()->error("pefeat_process_raw_features: {}", e.what());
    return PEFEAT_ERR_INVALID_ARGUMENT;
  }
}

void pefeat_free(char* p) {
  std::free(p);
}

int pefeat_init_logging(const char* level) {
  std::string name = "warn";
  if (level) {
    name = level;
  } else if (auto env = pefeat::getenv_string("PEFEAT_LOG_LEVEL")) {
    name = *env;
  }
  spdlog::level::level_enum lvl = spdlog::level::warn;
  if (!pefeat::parse_level(name, lvl)) {
    return PEFEAT_ERR_INVALID_ARGUMENT;
  }
  pefeat::init_logging(lvl);
  return PEFEAT_OK;
}
