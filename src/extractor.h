#pragma once

#include "feature_registry.h"
#include "pefeat_internal.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pefeat {

// Parser-library version each feature version was originally computed with.
std::string reference_parser_version(int feature_version);

// Immutable after construction; every method is const and safe to call from
// many threads at once.
class PeFeatureExtractor {
 public:
  // Throws std::invalid_argument for an unsupported version or bad config.
  explicit PeFeatureExtractor(int feature_version = 2);
  explicit PeFeatureExtractor(const Config& cfg);

  // Never throws for malformed input; an unparseable buffer gets defaults.
  nlohmann::json raw_features(const std::vector<std::uint8_t>& bytes) const;

  // Throws std::invalid_argument if `raw` lacks an extractor entry or holds
  // values of the wrong type.
  std::vector<float> process_raw_features(const nlohmann::json& raw) const;

  std::vector<float> feature_vector(const std::vector<std::uint8_t>& bytes) const;

  std::size_t dim() const { return set_.dim; }
  int version() const { return set_.version; }
  const Config& config() const { return cfg_; }

  std::vector<std::string> feature_names() const;

  // Start index of an extractor's slice in the vector.
  std::optional<std::size_t> feature_offset(const std::string& name) const;

 private:
  Config cfg_;
  FeatureSet set_;
};

}
