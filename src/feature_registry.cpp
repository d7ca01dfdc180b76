#include "feature_registry.h"

#include <array>

namespace pefeat {

static constexpr std::array<FeatureSpec, 8> FEATURES_V1 = {{
    {FeatureKind::kByteHistogram, "histogram", BYTE_HISTOGRAM_DIM},
    {FeatureKind::kByteEntropy, "byteentropy", BYTE_ENTROPY_DIM},
    {FeatureKind::kStrings, "strings", STRINGS_DIM},
    {FeatureKind::kGeneral, "general", GENERAL_DIM},
    {FeatureKind::kHeader, "header", HEADER_DIM},
    {FeatureKind::kSection, "section", SECTION_DIM},
    {FeatureKind::kImports, "imports", IMPORTS_DIM},
    {FeatureKind::kExports, "exports", EXPORTS_DIM},
}};

static constexpr std::array<FeatureSpec, 9> FEATURES_V2 = {{
    {FeatureKind::kByteHistogram, "histogram", BYTE_HISTOGRAM_DIM},
    {FeatureKind::kByteEntropy, "byteentropy", BYTE_ENTROPY_DIM},
    {FeatureKind::kStrings, "strings", STRINGS_DIM},
    {FeatureKind::kGeneral, "general", GENERAL_DIM},
    {FeatureKind::kHeader, "header", HEADER_DIM},
    {FeatureKind::kSection, "section", SECTION_DIM},
    {FeatureKind::kImports, "imports", IMPORTS_DIM},
    {FeatureKind::kExports, "exports", EXPORTS_DIM},
    {FeatureKind::kDataDirectories, "datadirectories", DATA_DIRECTORIES_DIM},
}};

template <std::size_t N>
static constexpr std::size_t total_dim(const std::array<FeatureSpec, N>& specs) {
  std::size_t d = 0;
  for (const FeatureSpec& s : specs) d += s.dim;
  return d;
}

static_assert(total_dim(FEATURES_V1) == 2351, "feature version 1 dimension");
static_assert(total_dim(FEATURES_V2) == 2381, "feature version 2 dimension");

template <std::size_t N>
static FeatureSet make_set(int version, const std::array<FeatureSpec, N>& specs) {
  FeatureSet fs;
  fs.version = version;
  fs.features.assign(specs.begin(), specs.end());
  fs.dim = total_dim(specs);
  return fs;
}

std::optional<FeatureSet> feature_set(int version) {
  switch (version) {
    case 1: return make_set(1, FEATURES_V1);
    case 2: return make_set(2, FEATURES_V2);
    default: return std::nullopt;
  }
}

nlohmann::json feature_raw(
    FeatureKind kind,
    const std::vector<std::uint8_t>& bytes,
    const PeStructure* pe,
    const Config& cfg) {
  switch (kind) {
    case FeatureKind::kByteHistogram: return byte_histogram_raw(bytes);
    case FeatureKind::kByteEntropy: return byte_entropy_raw(bytes, cfg.entropy_window, cfg.entropy_step);
    case FeatureKind::kStrings: return strings_raw(bytes);
    case FeatureKind::kGeneral: return general_raw(bytes, pe);
    case FeatureKind::kHeader: return header_raw(pe);
    case FeatureKind::kSection: return section_raw(pe);
    case FeatureKind::kImports: return imports_raw(pe);
    case FeatureKind::kExports: return exports_raw(pe);
    case FeatureKind::kDataDirectories: return data_directories_raw(pe);
  }
  return nullptr;
}

void feature_vector_append(FeatureKind kind, const nlohmann::json& raw, std::vector<float>& out) {
  switch (kind) {
    case FeatureKind::kByteHistogram: byte_histogram_vector(raw, out); return;
    case FeatureKind::kByteEntropy: byte_entropy_vector(raw, out); return;
    case FeatureKind::kStrings: strings_vector(raw, out); return;
    case FeatureKind::kGeneral: general_vector(raw, out); return;
    case FeatureKind::kHeader: header_vector(raw, out); return;
    case FeatureKind::kSection: section_vector(raw, out); return;
    case FeatureKind::kImports: imports_vector(raw, out); return;
    case FeatureKind::kExports: exports_vector(raw, out); return;
    case FeatureKind::kDataDirectories: data_directories_vector(raw, out); return;
  }
}

}
