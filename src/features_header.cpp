#include "feature_extractors.h"

#include "feature_hasher.h"

#include <string>

namespace pefeat {

static constexpr std::size_t HEADER_HASH_BUCKETS = 10;

nlohmann::json general_raw(const std::vector<std::uint8_t>& bytes, const PeStructure* pe) {
  nlohmann::json j;
  j["size"] = bytes.size();
  if (!pe) {
    j["vsize"] = 0;
    j["has_debug"] = 0;
    j["exports"] = 0;
    j["imports"] = 0;
    j["has_relocations"] = 0;
    j["has_resources"] = 0;
    j["has_signature"] = 0;
    j["has_tls"] = 0;
    j["symbols"] = 0;
    return j;
  }
  j["vsize"] = pe->virtual_size;
  j["has_debug"] = pe->has_debug ? 1 : 0;
  j["exports"] = pe->exported_function_count;
  j["imports"] = pe->imported_function_count;
  j["has_relocations"] = pe->has_relocations ? 1 : 0;
  j["has_resources"] = pe->has_resources ? 1 : 0;
  j["has_signature"] = pe->has_signature ? 1 : 0;
  j["has_tls"] = pe->has_tls ? 1 : 0;
  j["symbols"] = pe->symbol_count;
  return j;
}

void general_vector(const nlohmann::json& raw, std::vector<float>& out) {
  static constexpr const char* KEYS[] = {
      "size", "vsize", "has_debug", "exports", "imports",
      "has_relocations", "has_resources", "has_signature", "has_tls", "symbols"};
  for (const char* k : KEYS) {
    out.push_back(raw.at(k).get<float>());
  }
}

nlohmann::json header_raw(const PeStructure* pe) {
  nlohmann::json coff;
  nlohmann::json optional;
  if (!pe) {
    coff["timestamp"] = 0;
    coff["machine"] = "";
    coff["characteristics"] = nlohmann::json::array();
    optional["subsystem"] = "";
    optional["dll_characteristics"] = nlohmann::json::array();
    optional["magic"] = "";
    for (const char* k : {"major_image_version", "minor_image_version", "major_linker_version", "minor_linker_version",
                          "major_operating_system_version", "minor_operating_system_version",
                          "major_subsystem_version", "minor_subsystem_version", "sizeof_code", "sizeof_headers",
                          "sizeof_heap_commit"}) {
      optional[k] = 0;
    }
  } else {
    const PeOptionalHeader& oh = pe->optional;
    coff["timestamp"] = pe->coff.timestamp;
    coff["machine"] = pe->coff.machine_name;
    coff["characteristics"] = pe->coff.characteristics_list;
    optional["subsystem"] = oh.subsystem_name;
    optional["dll_characteristics"] = oh.dll_characteristics_list;
    optional["magic"] = oh.magic_name;
    optional["major_image_version"] = oh.major_image_version;
    optional["minor_image_version"] = oh.minor_image_version;
    optional["major_linker_version"] = oh.major_linker_version;
    optional["minor_linker_version"] = oh.minor_linker_version;
    optional["major_operating_system_version"] = oh.major_operating_system_version;
    optional["minor_operating_system_version"] = oh.minor_operating_system_version;
    optional["major_subsystem_version"] = oh.major_subsystem_version;
    optional["minor_subsystem_version"] = oh.minor_subsystem_version;
    optional["sizeof_code"] = oh.sizeof_code;
    optional["sizeof_headers"] = oh.sizeof_headers;
    optional["sizeof_heap_commit"] = oh.sizeof_heap_commit;
  }

  nlohmann::json j;
  j["coff"] = std::move(coff);
  j["optional"] = std::move(optional);
  return j;
}

static void append(std::vector<float>& out, const std::vector<float>& v) {
  out.insert(out.end(), v.begin(), v.end());
}

void header_vector(const nlohmann::json& raw, std::vector<float>& out) {
  const nlohmann::json& coff = raw.at("coff");
  const nlohmann::json& optional = raw.at("optional");

  out.push_back(coff.at("timestamp").get<float>());
  append(out, hash_strings({coff.at("machine").get<std::string>()}, HEADER_HASH_BUCKETS));
  append(out, hash_strings(coff.at("characteristics").get<std::vector<std::string>>(), HEADER_HASH_BUCKETS));
  append(out, hash_strings({optional.at("subsystem").get<std::string>()}, HEADER_HASH_BUCKETS));
  append(out, hash_strings(optional.at("dll_characteristics").get<std::vector<std::string>>(), HEADER_HASH_BUCKETS));
  append(out, hash_strings({optional.at("magic").get<std::string>()}, HEADER_HASH_BUCKETS));

  static constexpr const char* NUMERIC_KEYS[] = {
      "major_image_version", "minor_image_version", "major_linker_version", "minor_linker_version",
      "major_operating_system_version", "minor_operating_system_version", "major_subsystem_version",
      "minor_subsystem_version", "sizeof_code", "sizeof_headers", "sizeof_heap_commit"};
  for (const char* k : NUMERIC_KEYS) {
    out.push_back(optional.at(k).get<float>());
  }
}

}
