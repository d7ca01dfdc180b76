#pragma once

#include "pe_structure.h"
#include "pefeat_internal.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pefeat {

// Returns std::nullopt for anything that is not a parseable PE. Never throws
// for malformed input.
std::optional<PeStructure> parse_pe(const std::vector<std::uint8_t>& bytes, const ParserLimits& limits);

// Version string of the linked parser library.
std::string parser_library_version();

double shannon_entropy(const std::uint8_t* data, std::size_t len);

// Fills PeSection::entropy from each section's raw range clamped to `bytes`.
// At most `budget` bytes are scanned across all sections; a section that does
// not fit in what is left keeps entropy 0.
void compute_section_entropy(
    std::vector<PeSection>& sections,
    const std::vector<std::uint8_t>& bytes,
    std::uint64_t budget);

// Replaces every ill-formed UTF-8 sequence with U+FFFD.
std::string sanitize_utf8(const std::string& s);

}
