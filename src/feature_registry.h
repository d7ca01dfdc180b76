#pragma once

#include "feature_extractors.h"
#include "pefeat_internal.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace pefeat {

enum class FeatureKind {
  kByteHistogram,
  kByteEntropy,
  kStrings,
  kGeneral,
  kHeader,
  kSection,
  kImports,
  kExports,
  kDataDirectories,
};

struct FeatureSpec {
  FeatureKind kind;
  const char* name;
  std::size_t dim;
};

struct FeatureSet {
  int version = 0;
  std::vector<FeatureSpec> features;
  std::size_t dim = 0;
};

// Static registry: version -> ordered extractor list and total dimension.
// Returns std::nullopt for versions other than 1 and 2.
std::optional<FeatureSet> feature_set(int version);

nlohmann::json feature_raw(
    FeatureKind kind,
    const std::vector<std::uint8_t>& bytes,
    const PeStructure* pe,
    const Config& cfg);

void feature_vector_append(FeatureKind kind, const nlohmann::json& raw, std::vector<float>& out);

}
