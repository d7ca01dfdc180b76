#include "feature_extractors.h"

#include "feature_hasher.h"

#include <map>
#include <set>
#include <string>

namespace pefeat {

static constexpr std::size_t LIBRARY_HASH_BUCKETS = 256;
static constexpr std::size_t IMPORT_HASH_BUCKETS = 1024;
static constexpr std::size_t EXPORT_HASH_BUCKETS = 128;

static std::string lower_ascii(std::string s) {
  for (char& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

nlohmann::json imports_raw(const PeStructure* pe) {
  nlohmann::json j = nlohmann::json::object();
  if (!pe) return j;
  for (const PeImportLibrary& lib : pe->imports) {
    nlohmann::json& entries = j[lib.name];
    if (entries.is_null()) entries = nlohmann::json::array();
    for (const PeImportSymbol& sym : lib.symbols) {
      if (sym.is_ordinal) {
        entries.push_back("ordinal" + std::to_string(sym.ordinal));
      } else {
        entries.push_back(sym.name);
      }
    }
  }
  return j;
}

void imports_vector(const nlohmann::json& raw, std::vector<float>& out) {
  auto by_library = raw.get<std::map<std::string, std::vector<std::string>>>();
  std::set<std::string> libraries;
  std::vector<std::string> imports;
  for (const auto& [name, symbols] : by_library) {
    std::string lib = lower_ascii(name);
    for (const std::string& sym : symbols) {
      imports.push_back(lib + ":" + sym);
    }
    libraries.insert(std::move(lib));
  }

  auto libraries_hashed = hash_strings(std::vector<std::string>(libraries.begin(), libraries.end()), LIBRARY_HASH_BUCKETS);
  auto imports_hashed = hash_strings(imports, IMPORT_HASH_BUCKETS);
  out.insert(out.end(), libraries_hashed.begin(), libraries_hashed.end());
  out.insert(out.end(), imports_hashed.begin(), imports_hashed.end());
}

nlohmann::json exports_raw(const PeStructure* pe) {
  nlohmann::json j = nlohmann::json::array();
  if (!pe) return j;
  for (const std::string& name : pe->exports) {
    j.push_back(name);
  }
  return j;
}

void exports_vector(const nlohmann::json& raw, std::vector<float>& out) {
  auto hashed = hash_strings(raw.get<std::vector<std::string>>(), EXPORT_HASH_BUCKETS);
  out.insert(out.end(), hashed.begin(), hashed.end());
}

}
