#include "pe_parser.h"

#include "logging.h"
#include "pe_constants.h"

#include <LIEF/PE.hpp>
#include <LIEF/version.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <exception>
#include <iterator>
#include <memory>
#include <unordered_map>

namespace pefeat {

static std::size_t range_count(const auto& r) {
  return static_cast<std::size_t>(std::distance(r.begin(), r.end()));
}

std::string sanitize_utf8(const std::string& s) {
  static constexpr const char* REPLACEMENT = "\xEF\xBF\xBD";
  std::string out;
  out.reserve(s.size());
  std::size_t i = 0;
  const std::size_t n = s.size();
  while (i < n) {
    auto b = static_cast<unsigned char>(s[i]);
    if (b < 0x80) {
      out.push_back(s[i]);
      ++i;
      continue;
    }
    std::size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xbf;
    if (b >= 0xc2 && b <= 0xdf) {
      len = 2;
    } else if (b >= 0xe0 && b <= 0xef) {
      len = 3;
      if (b == 0xe0) lo = 0xa0;
      if (b == 0xed) hi = 0x9f;
    } else if (b >= 0xf0 && b <= 0xf4) {
      len = 4;
      if (b == 0xf0) lo = 0x90;
      if (b == 0xf4) hi = 0x8f;
    } else {
      out += REPLACEMENT;
      ++i;
      continue;
    }

    std::size_t j = 1;
    for (; j < len && i + j < n; ++j) {
      auto c = static_cast<unsigned char>(s[i + j]);
      if (c < (j == 1 ? lo : 0x80) || c > (j == 1 ? hi : 0xbf)) break;
    }
    if (j == len) {
      out.append(s, i, len);
      i += len;
    } else {
      // maximal ill-formed subpart becomes one replacement character
      out += REPLACEMENT;
      i += j;
    }
  }
  return out;
}

static std::string clip_name(std::string s, const ParserLimits& limits) {
  if (s.size() > limits.max_name_length) s.resize(limits.max_name_length);
  return sanitize_utf8(s);
}

void compute_section_entropy(
    std::vector<PeSection>& sections,
    const std::vector<std::uint8_t>& bytes,
    std::uint64_t budget) {
  std::uint64_t scanned = 0;
  bool exhausted = false;
  for (PeSection& sec : sections) {
    sec.entropy = 0.0;
    std::uint64_t begin = sec.pointer_to_raw_data;
    if (begin >= bytes.size()) continue;
    std::uint64_t end = std::min<std::uint64_t>(begin + sec.size, bytes.size());
    std::uint64_t len = end - begin;
    if (len > budget - scanned) {
      exhausted = true;
      continue;
    }
    scanned += len;
    sec.entropy = shannon_entropy(bytes.data() + begin, static_cast<std::size_t>(len));
  }
  if (exhausted) {
    logger()->debug("section entropy budget of {} bytes exhausted; remaining sections get entropy 0", budget);
  }
}

double shannon_entropy(const std::uint8_t* data, std::size_t len) {
  if (!data || len == 0) return 0.0;
  std::array<std::uint64_t, 256> counts{};
  for (std::size_t i = 0; i < len; ++i) counts[data[i]]++;
  double inv = 1.0 / static_cast<double>(len);
  double s = 0.0;
  for (std::size_t i = 0; i < 256; ++i) {
    if (counts[i] == 0) continue;
    double p = static_cast<double>(counts[i]) * inv;
    s += p * std::log2(p);
  }
  return -s;
}

static std::vector<PeSection> model_sections(
    const LIEF::PE::Binary& bin,
    const std::vector<std::uint8_t>& bytes,
    const ParserLimits& limits) {
  std::vector<PeSection> out;
  std::size_t count = range_count(bin.sections());
  if (count > limits.max_sections) {
    logger()->debug("section table has {} entries, limit is {}; dropping sections", count, limits.max_sections);
    return out;
  }
  out.reserve(count);
  for (const LIEF::PE::Section& s : bin.sections()) {
    PeSection sec;
    sec.name = clip_name(s.name(), limits);
    sec.virtual_address = static_cast<std::uint32_t>(s.virtual_address());
    sec.size = s.sizeof_raw_data();
    sec.virtual_size = s.virtual_size();
    sec.pointer_to_raw_data = s.pointerto_raw_data();
    sec.characteristics = s.characteristics();
    sec.props = section_characteristics_list(sec.characteristics);
    out.push_back(std::move(sec));
  }
  std::uint64_t budget = static_cast<std::uint64_t>(limits.max_entropy_scan_factor) * bytes.size();
  compute_section_entropy(out, bytes, budget);
  return out;
}

static std::vector<PeImportLibrary> model_imports(const LIEF::PE::Binary& bin, const ParserLimits& limits) {
  std::vector<PeImportLibrary> out;
  if (!bin.has_imports()) return out;

  std::size_t lib_count = range_count(bin.imports());
  if (lib_count > limits.max_import_libraries) {
    logger()->debug("import table has {} libraries, limit is {}; dropping imports", lib_count, limits.max_import_libraries);
    return out;
  }

  std::unordered_map<std::string, std::size_t> index_by_name;
  std::size_t total = 0;
  for (const LIEF::PE::Import& imp : bin.imports()) {
    std::size_t entry_count = range_count(imp.entries());
    total += entry_count;
    if (entry_count > limits.max_imports_per_library || total > limits.max_total_imports) {
      logger()->debug("import table exceeds entry limits; dropping imports");
      return {};
    }

    std::string lib_name = clip_name(imp.name(), limits);
    auto it = index_by_name.find(lib_name);
    std::size_t idx = 0;
    if (it == index_by_name.end()) {
      idx = out.size();
      index_by_name.emplace(lib_name, idx);
      out.push_back(PeImportLibrary{lib_name, {}});
    } else {
      idx = it->second;
    }

    for (const LIEF::PE::ImportEntry& e : imp.entries()) {
      PeImportSymbol sym;
      if (e.is_ordinal()) {
        sym.is_ordinal = true;
        sym.ordinal = e.ordinal();
      } else {
        sym.name = clip_name(e.name(), limits);
      }
      out[idx].symbols.push_back(std::move(sym));
    }
  }
  return out;
}

static std::vector<std::string> model_exports(const LIEF::PE::Binary& bin, const ParserLimits& limits) {
  std::vector<std::string> out;
  if (!bin.has_exports()) return out;
  const LIEF::PE::Export* ex = bin.get_export();
  if (!ex) return out;

  std::size_t count = range_count(ex->entries());
  if (count > limits.max_exports) {
    logger()->debug("export table has {} entries, limit is {}; dropping exports", count, limits.max_exports);
    return out;
  }
  for (const LIEF::PE::ExportEntry& e : ex->entries()) {
    if (e.name().empty()) continue;
    out.push_back(clip_name(e.name(), limits));
  }
  return out;
}

static std::vector<PeDataDirectory> model_data_directories(const LIEF::PE::Binary& bin, const ParserLimits& limits) {
  std::vector<PeDataDirectory> out;
  std::size_t max_count = std::min<std::size_t>(limits.max_data_directories, DATA_DIRECTORY_NAMES.size());
  for (const LIEF::PE::DataDirectory& dd : bin.data_directories()) {
    if (out.size() >= max_count) break;
    PeDataDirectory d;
    d.name = DATA_DIRECTORY_NAMES[out.size()];
    d.size = dd.size();
    d.virtual_address = dd.RVA();
    out.push_back(std::move(d));
  }
  return out;
}

static constexpr std::size_t RESOURCE_DIRECTORY = 2;
static constexpr std::size_t CERTIFICATE_DIRECTORY = 4;
static constexpr std::size_t BASE_RELOCATION_DIRECTORY = 5;

static bool directory_present(const PeStructure& pe, std::size_t index) {
  if (index >= pe.data_directories.size()) return false;
  const PeDataDirectory& d = pe.data_directories[index];
  return d.size != 0 && d.virtual_address != 0;
}

static PeStructure model_binary(
    const LIEF::PE::Binary& bin,
    const std::vector<std::uint8_t>& bytes,
    const ParserLimits& limits) {
  PeStructure pe;

  const LIEF::PE::Header& hdr = bin.header();
  pe.coff.timestamp = hdr.time_date_stamp();
  pe.coff.machine = static_cast<std::uint16_t>(hdr.machine());
  pe.coff.machine_name = machine_name(pe.coff.machine);
  pe.coff.characteristics = static_cast<std::uint32_t>(hdr.characteristics());
  pe.coff.characteristics_list = coff_characteristics_list(pe.coff.characteristics);

  const LIEF::PE::OptionalHeader& oh = bin.optional_header();
  pe.optional.magic = static_cast<std::uint32_t>(oh.magic());
  pe.optional.magic_name = magic_name(pe.optional.magic);
  pe.optional.subsystem = static_cast<std::uint32_t>(oh.subsystem());
  pe.optional.subsystem_name = subsystem_name(pe.optional.subsystem);
  pe.optional.dll_characteristics = static_cast<std::uint32_t>(oh.dll_characteristics());
  pe.optional.dll_characteristics_list = dll_characteristics_list(pe.optional.dll_characteristics);
  pe.optional.entrypoint_rva = static_cast<std::uint32_t>(oh.addressof_entrypoint());
  pe.optional.major_image_version = oh.major_image_version();
  pe.optional.minor_image_version = oh.minor_image_version();
  pe.optional.major_linker_version = oh.major_linker_version();
  pe.optional.minor_linker_version = oh.minor_linker_version();
  pe.optional.major_operating_system_version = oh.major_operating_system_version();
  pe.optional.minor_operating_system_version = oh.minor_operating_system_version();
  pe.optional.major_subsystem_version = oh.major_subsystem_version();
  pe.optional.minor_subsystem_version = oh.minor_subsystem_version();
  pe.optional.sizeof_code = oh.sizeof_code();
  pe.optional.sizeof_headers = oh.sizeof_headers();
  pe.optional.sizeof_heap_commit = oh.sizeof_heap_commit();

  pe.sections = model_sections(bin, bytes, limits);
  pe.imports = model_imports(bin, limits);
  pe.exports = model_exports(bin, limits);
  pe.data_directories = model_data_directories(bin, limits);

  // Resource, relocation and signature parsing is switched off; their
  // presence comes from the data directory table.
  pe.has_debug = bin.has_debug();
  pe.has_relocations = directory_present(pe, BASE_RELOCATION_DIRECTORY);
  pe.has_resources = directory_present(pe, RESOURCE_DIRECTORY);
  pe.has_signature = directory_present(pe, CERTIFICATE_DIRECTORY);
  pe.has_tls = bin.has_tls();
  pe.exported_function_count = pe.exports.size();
  for (const PeImportLibrary& lib : pe.imports) {
    for (const PeImportSymbol& sym : lib.symbols) {
      if (!sym.is_ordinal) pe.imported_function_count++;
    }
  }
  pe.symbol_count = range_count(bin.symbols());
  pe.virtual_size = bin.virtual_size();
  return pe;
}

std::optional<PeStructure> parse_pe(const std::vector<std::uint8_t>& bytes, const ParserLimits& limits) {
  if (bytes.size() < 2 || bytes[0] != 'M' || bytes[1] != 'Z') {
    return std::nullopt;
  }
  try {
    if (!LIEF::PE::is_pe(bytes)) {
      return std::nullopt;
    }
    LIEF::PE::ParserConfig conf = LIEF::PE::ParserConfig::all();
    conf.parse_signature = false;
    conf.parse_rsrc = false;
    conf.parse_reloc = false;
    std::unique_ptr<LIEF::PE::Binary> bin = LIEF::PE::Parser::parse(bytes, conf);
    if (!bin) {
      logger()->debug("pe parser rejected {}-byte buffer", bytes.size());
      return std::nullopt;
    }
    return model_binary(*bin, bytes, limits);
  } catch (const std::exception& e) {
    logger()->debug("pe parser error: {}", e.what());
    return std::nullopt;
  }
}

std::string parser_library_version() {
  return std::string(LIEF_VERSION);
}

}
