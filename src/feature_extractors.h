#pragma once

#include "pe_structure.h"

#include <nlohmann/json.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace pefeat {

// Each feature domain has a raw stage (bytes + optional structure -> JSON)
// and a vector stage that appends exactly its *_DIM floats to `out`.
// A null `pe` means the buffer did not parse as PE.

static constexpr std::size_t BYTE_HISTOGRAM_DIM = 256;
static constexpr std::size_t BYTE_ENTROPY_DIM = 256;
static constexpr std::size_t STRINGS_DIM = 1 + 1 + 1 + 96 + 1 + 1 + 1 + 1 + 1;
static constexpr std::size_t GENERAL_DIM = 10;
static constexpr std::size_t HEADER_DIM = 62;
static constexpr std::size_t SECTION_DIM = 5 + 50 * 5;
static constexpr std::size_t IMPORTS_DIM = 256 + 1024;
static constexpr std::size_t EXPORTS_DIM = 128;
static constexpr std::size_t DATA_DIRECTORIES_DIM = 15 * 2;

nlohmann::json byte_histogram_raw(const std::vector<std::uint8_t>& bytes);
void byte_histogram_vector(const nlohmann::json& raw, std::vector<float>& out);

// Row index into the 16x16 byte/entropy grid for one window; always 0..15.
std::size_t entropy_bin(const std::array<std::uint64_t, 16>& coarse, std::size_t window);
nlohmann::json byte_entropy_raw(const std::vector<std::uint8_t>& bytes, std::size_t window, std::size_t step);
void byte_entropy_vector(const nlohmann::json& raw, std::vector<float>& out);

nlohmann::json strings_raw(const std::vector<std::uint8_t>& bytes);
void strings_vector(const nlohmann::json& raw, std::vector<float>& out);

nlohmann::json general_raw(const std::vector<std::uint8_t>& bytes, const PeStructure* pe);
void general_vector(const nlohmann::json& raw, std::vector<float>& out);

nlohmann::json header_raw(const PeStructure* pe);
void header_vector(const nlohmann::json& raw, std::vector<float>& out);

nlohmann::json section_raw(const PeStructure* pe);
void section_vector(const nlohmann::json& raw, std::vector<float>& out);

nlohmann::json imports_raw(const PeStructure* pe);
void imports_vector(const nlohmann::json& raw, std::vector<float>& out);

nlohmann::json exports_raw(const PeStructure* pe);
void exports_vector(const nlohmann::json& raw, std::vector<float>& out);

nlohmann::json data_directories_raw(const PeStructure* pe);
void data_directories_vector(const nlohmann::json& raw, std::vector<float>& out);

}
