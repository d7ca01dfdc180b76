#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pefeat {

struct PeSection {
  std::string name;
  std::uint32_t virtual_address = 0;
  std::uint64_t size = 0;
  std::uint64_t virtual_size = 0;
  std::uint32_t pointer_to_raw_data = 0;
  double entropy = 0.0;
  std::uint32_t characteristics = 0;
  std::vector<std::string> props;
};

struct PeImportSymbol {
  std::string name;
  std::uint32_t ordinal = 0;
  bool is_ordinal = false;
};

struct PeImportLibrary {
  std::string name;
  std::vector<PeImportSymbol> symbols;
};

struct PeDataDirectory {
  std::string name;
  std::uint32_t size = 0;
  std::uint32_t virtual_address = 0;
};

struct PeCoffHeader {
  std::uint32_t timestamp = 0;
  std::uint16_t machine = 0;
  std::string machine_name;
  std::uint32_t characteristics = 0;
  std::vector<std::string> characteristics_list;
};

struct PeOptionalHeader {
  std::uint32_t magic = 0;
  std::string magic_name;
  std::uint32_t subsystem = 0;
  std::string subsystem_name;
  std::uint32_t dll_characteristics = 0;
  std::vector<std::string> dll_characteristics_list;
  std::uint32_t entrypoint_rva = 0;
  std::uint32_t major_image_version = 0;
  std::uint32_t minor_image_version = 0;
  std::uint32_t major_linker_version = 0;
  std::uint32_t minor_linker_version = 0;
  std::uint32_t major_operating_system_version = 0;
  std::uint32_t minor_operating_system_version = 0;
  std::uint32_t major_subsystem_version = 0;
  std::uint32_t minor_subsystem_version = 0;
  std::uint64_t sizeof_code = 0;
  std::uint64_t sizeof_headers = 0;
  std::uint64_t sizeof_heap_commit = 0;
};

// Modeled view of a parsed PE. Built whole by parse_pe; absent sub-structures
// are empty vectors and zero counts.
struct PeStructure {
  PeCoffHeader coff;
  PeOptionalHeader optional;
  std::vector<PeSection> sections;
  std::vector<PeImportLibrary> imports;
  std::vector<std::string> exports;
  std::vector<PeDataDirectory> data_directories;

  bool has_debug = false;
  bool has_relocations = false;
  bool has_resources = false;
  bool has_signature = false;
  bool has_tls = false;
  std::size_t exported_function_count = 0;
  std::size_t imported_function_count = 0;
  std::size_t symbol_count = 0;
  std::uint64_t virtual_size = 0;

  std::optional<std::size_t> entry_section_index() const;
  bool section_has_prop(std::size_t index, const std::string& prop) const;
};

}
