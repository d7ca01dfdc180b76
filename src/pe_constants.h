#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace pefeat {

static constexpr std::uint32_t SECTION_MEM_EXECUTE = 0x20000000u;
static constexpr std::uint32_t SECTION_MEM_READ = 0x40000000u;
static constexpr std::uint32_t SECTION_MEM_WRITE = 0x80000000u;

static constexpr std::uint32_t PE32_MAGIC = 0x10b;
static constexpr std::uint32_t PE32_PLUS_MAGIC = 0x20b;

static constexpr std::size_t DATA_DIRECTORY_COUNT = 15;

// Canonical data directory order; index i is optional-header slot i.
extern const std::array<const char*, 16> DATA_DIRECTORY_NAMES;

std::string machine_name(std::uint16_t machine);
std::string subsystem_name(std::uint32_t subsystem);
std::string magic_name(std::uint32_t magic);

std::vector<std::string> coff_characteristics_list(std::uint32_t characteristics);
std::vector<std::string> dll_characteristics_list(std::uint32_t characteristics);
std::vector<std::string> section_characteristics_list(std::uint32_t characteristics);

}
