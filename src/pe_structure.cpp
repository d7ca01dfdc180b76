#include "pe_structure.h"

#include "pe_constants.h"

#include <algorithm>

namespace pefeat {

std::optional<std::size_t> PeStructure::entry_section_index() const {
  std::uint64_t entry_rva = optional.entrypoint_rva;
  for (std::size_t i = 0; i < sections.size(); ++i) {
    const PeSection& s = sections[i];
    std::uint64_t start = s.virtual_address;
    std::uint64_t end = start + std::max<std::uint64_t>(s.virtual_size, s.size);
    if (entry_rva >= start && entry_rva < end) {
      return i;
    }
  }
  return std::nullopt;
}

bool PeStructure::section_has_prop(std::size_t index, const std::string& prop) const {
  if (index >= sections.size()) return false;
  const auto& props = sections[index].props;
  return std::find(props.begin(), props.end(), prop) != props.end();
}

}
