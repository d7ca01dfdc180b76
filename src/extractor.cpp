#include "extractor.h"

#include "config.h"
#include "logging.h"
#include "pe_parser.h"
#include "sha256.h"

#include <array>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace pefeat {

std::string reference_parser_version(int feature_version) {
  switch (feature_version) {
    case 1: return "0.8.3";
    case 2: return "0.9.0";
    default: return {};
  }
}

static void warn_parser_version_once(int feature_version) {
  static std::array<std::once_flag, 2> flags;
  if (feature_version < 1 || feature_version > 2) return;
  std::call_once(flags[static_cast<std::size_t>(feature_version - 1)], [feature_version]() {
    std::string expected = reference_parser_version(feature_version);
    std::string linked = parser_library_version();
    if (linked.rfind(expected, 0) == 0) return;
    logger()->warn(
        "feature version {} was computed with LIEF {}; LIEF {} is linked. There may be slight inconsistencies "
        "in the feature calculations.",
        feature_version, expected, linked);
  });
}

PeFeatureExtractor::PeFeatureExtractor(int feature_version)
    : PeFeatureExtractor([feature_version]() {
        Config cfg;
        cfg.feature_version = feature_version;
        return cfg;
      }()) {}

PeFeatureExtractor::PeFeatureExtractor(const Config& cfg) : cfg_(cfg) {
  validate_config(cfg_);
  auto fs = feature_set(cfg_.feature_version);
  if (!fs) {
    throw std::invalid_argument("feature version must be 1 or 2, not " + std::to_string(cfg_.feature_version));
  }
  set_ = std::move(*fs);
  if (cfg_.print_feature_warning) {
    warn_parser_version_once(set_.version);
  }
}

nlohmann::json PeFeatureExtractor::raw_features(const std::vector<std::uint8_t>& bytes) const {
  std::optional<PeStructure> pe = parse_pe(bytes, cfg_.limits);
  const PeStructure* pe_ptr = pe ? &*pe : nullptr;

  nlohmann::json record = nlohmann::json::object();
  record["sha256"] = sha256_hex(bytes);
  for (const FeatureSpec& spec : set_.features) {
    record[spec.name] = feature_raw(spec.kind, bytes, pe_ptr, cfg_);
  }
  return record;
}

std::vector<float> PeFeatureExtractor::process_raw_features(const nlohmann::json& raw) const {
  if (!raw.is_object()) {
    throw std::invalid_argument("raw feature record must be a JSON object");
  }

  std::vector<float> out;
  out.reserve(set_.dim);
  for (const FeatureSpec& spec : set_.features) {
    auto it = raw.find(spec.name);
    if (it == raw.end()) {
      throw std::invalid_argument(std::string("raw feature record has no '") + spec.name + "' entry");
    }
    std::size_t before = out.size();
    try {
      feature_vector_append(spec.kind, *it, out);
    } catch (const nlohmann::json::exception& e) {
      throw std::invalid_argument(std::string("raw feature '") + spec.name + "' is malformed: " + e.what());
    }
    if (out.size() - before != spec.dim) {
      throw std::logic_error(std::string("extractor '") + spec.name + "' produced " +
                             std::to_string(out.size() - before) + " values, expected " + std::to_string(spec.dim));
    }
  }
  return out;
}

std::vector<float> PeFeatureExtractor::feature_vector(const std::vector<std::uint8_t>& bytes) const {
  return process_raw_features(raw_features(bytes));
}

std::vector<std::string> PeFeatureExtractor::feature_names() const {
  std::vector<std::string> names;
  names.reserve(set_.features.size());
  for (const FeatureSpec& spec : set_.features) names.emplace_back(spec.name);
  return names;
}

std::optional<std::size_t> PeFeatureExtractor::feature_offset(const std::string& name) const {
  std::size_t offset = 0;
  for (const FeatureSpec& spec : set_.features) {
    if (name == spec.name) return offset;
    offset += spec.dim;
  }
  return std::nullopt;
}

}
