#include "feature_extractors.h"

#include "feature_hasher.h"
#include "pe_constants.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace pefeat {

static constexpr std::size_t SECTION_HASH_BUCKETS = 50;

static std::string entry_section_name(const PeStructure& pe) {
  auto idx = pe.entry_section_index();
  if (idx) return pe.sections[*idx].name;
  for (const PeSection& s : pe.sections) {
    if ((s.characteristics & SECTION_MEM_EXECUTE) != 0) return s.name;
  }
  return {};
}

nlohmann::json section_raw(const PeStructure* pe) {
  nlohmann::json j;
  j["entry"] = "";
  j["sections"] = nlohmann::json::array();
  if (!pe) return j;

  j["entry"] = entry_section_name(*pe);
  for (const PeSection& s : pe->sections) {
    nlohmann::json sj;
    sj["name"] = s.name;
    sj["size"] = s.size;
    sj["entropy"] = s.entropy;
    sj["vsize"] = s.virtual_size;
    sj["props"] = s.props;
    j["sections"].push_back(std::move(sj));
  }
  return j;
}

static bool has_prop(const std::vector<std::string>& props, const char* p) {
  return std::find(props.begin(), props.end(), p) != props.end();
}

void section_vector(const nlohmann::json& raw, std::vector<float>& out) {
  const nlohmann::json& sections = raw.at("sections");
  if (!sections.is_array()) {
    throw std::invalid_argument("section record 'sections' must be an array");
  }
  std::string entry = raw.at("entry").get<std::string>();

  std::size_t zero_size = 0;
  std::size_t empty_name = 0;
  std::size_t read_execute = 0;
  std::size_t write = 0;
  std::vector<std::pair<std::string, double>> sizes;
  std::vector<std::pair<std::string, double>> entropies;
  std::vector<std::pair<std::string, double>> vsizes;
  std::vector<std::string> entry_props;

  for (const nlohmann::json& s : sections) {
    std::string name = s.at("name").get<std::string>();
    double size = s.at("size").get<double>();
    auto props = s.at("props").get<std::vector<std::string>>();

    if (size == 0.0) zero_size++;
    if (name.empty()) empty_name++;
    if (has_prop(props, "MEM_READ") && has_prop(props, "MEM_EXECUTE")) read_execute++;
    if (has_prop(props, "MEM_WRITE")) write++;

    sizes.emplace_back(name, size);
    entropies.emplace_back(name, s.at("entropy").get<double>());
    vsizes.emplace_back(name, s.at("vsize").get<double>());
    if (name == entry) {
      entry_props.insert(entry_props.end(), props.begin(), props.end());
    }
  }

  out.push_back(static_cast<float>(sections.size()));
  out.push_back(static_cast<float>(zero_size));
  out.push_back(static_cast<float>(empty_name));
  out.push_back(static_cast<float>(read_execute));
  out.push_back(static_cast<float>(write));

  for (const auto* pairs : {&sizes, &entropies, &vsizes}) {
    auto hashed = hash_pairs(*pairs, SECTION_HASH_BUCKETS);
    out.insert(out.end(), hashed.begin(), hashed.end());
  }
  auto entry_hashed = hash_strings({entry}, SECTION_HASH_BUCKETS);
  out.insert(out.end(), entry_hashed.begin(), entry_hashed.end());
  auto props_hashed = hash_strings(entry_props, SECTION_HASH_BUCKETS);
  out.insert(out.end(), props_hashed.begin(), props_hashed.end());
}

}
