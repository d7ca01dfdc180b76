#include "feature_extractors.h"

#include "pe_constants.h"

#include <stdexcept>
#include <string>

namespace pefeat {

nlohmann::json data_directories_raw(const PeStructure* pe) {
  nlohmann::json j = nlohmann::json::array();
  if (!pe) return j;
  for (const PeDataDirectory& d : pe->data_directories) {
    j.push_back({{"name", d.name}, {"size", d.size}, {"virtual_address", d.virtual_address}});
  }
  return j;
}

void data_directories_vector(const nlohmann::json& raw, std::vector<float>& out) {
  if (!raw.is_array()) {
    throw std::invalid_argument("datadirectories record must be an array");
  }
  for (std::size_t i = 0; i < DATA_DIRECTORY_COUNT; ++i) {
    float size = 0.0f;
    float va = 0.0f;
    for (const nlohmann::json& d : raw) {
      if (d.at("name").get<std::string>() == DATA_DIRECTORY_NAMES[i]) {
        size = d.at("size").get<float>();
        va = d.at("virtual_address").get<float>();
        break;
      }
    }
    out.push_back(size);
    out.push_back(va);
  }
}

}
