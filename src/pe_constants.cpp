#include "pe_constants.h"

namespace pefeat {

const std::array<const char*, 16> DATA_DIRECTORY_NAMES = {
    "EXPORT_TABLE",     "IMPORT_TABLE",  "RESOURCE_TABLE",        "EXCEPTION_TABLE",
    "CERTIFICATE_TABLE", "BASE_RELOCATION_TABLE", "DEBUG",        "ARCHITECTURE",
    "GLOBAL_PTR",       "TLS_TABLE",     "LOAD_CONFIG_TABLE",     "BOUND_IMPORT",
    "IAT",              "DELAY_IMPORT_DESCRIPTOR", "CLR_RUNTIME_HEADER", "RESERVED"};

struct FlagName {
  std::uint32_t value;
  const char* name;
};

static constexpr std::array<FlagName, 15> COFF_CHARACTERISTICS = {{
    {0x0001, "RELOCS_STRIPPED"},
    {0x0002, "EXECUTABLE_IMAGE"},
    {0x0004, "LINE_NUMS_STRIPPED"},
    {0x0008, "LOCAL_SYMS_STRIPPED"},
    {0x0010, "AGGRESSIVE_WS_TRIM"},
    {0x0020, "LARGE_ADDRESS_AWARE"},
    {0x0080, "BYTES_REVERSED_LO"},
    {0x0100, "CHARA_32BIT_MACHINE"},
    {0x0200, "DEBUG_STRIPPED"},
    {0x0400, "REMOVABLE_RUN_FROM_SWAP"},
    {0x0800, "NET_RUN_FROM_SWAP"},
    {0x1000, "SYSTEM"},
    {0x2000, "DLL"},
    {0x4000, "UP_SYSTEM_ONLY"},
    {0x8000, "BYTES_REVERSED_HI"},
}};

static constexpr std::array<FlagName, 11> DLL_CHARACTERISTICS = {{
    {0x0020, "HIGH_ENTROPY_VA"},
    {0x0040, "DYNAMIC_BASE"},
    {0x0080, "FORCE_INTEGRITY"},
    {0x0100, "NX_COMPAT"},
    {0x0200, "NO_ISOLATION"},
    {0x0400, "NO_SEH"},
    {0x0800, "NO_BIND"},
    {0x1000, "APPCONTAINER"},
    {0x2000, "WDM_DRIVER"},
    {0x4000, "GUARD_CF"},
    {0x8000, "TERMINAL_SERVER_AWARE"},
}};

// ALIGN_* (0x00F00000) is a 4-bit field, decoded separately.
static constexpr std::array<FlagName, 20> SECTION_CHARACTERISTICS = {{
    {0x00000008, "TYPE_NO_PAD"},
    {0x00000020, "CNT_CODE"},
    {0x00000040, "CNT_INITIALIZED_DATA"},
    {0x00000080, "CNT_UNINITIALIZED_DATA"},
    {0x00000100, "LNK_OTHER"},
    {0x00000200, "LNK_INFO"},
    {0x00000800, "LNK_REMOVE"},
    {0x00001000, "LNK_COMDAT"},
    {0x00008000, "GPREL"},
    {0x00020000, "MEM_PURGEABLE"},
    {0x00040000, "MEM_LOCKED"},
    {0x00080000, "MEM_PRELOAD"},
    {0x01000000, "LNK_NRELOC_OVFL"},
    {0x02000000, "MEM_DISCARDABLE"},
    {0x04000000, "MEM_NOT_CACHED"},
    {0x08000000, "MEM_NOT_PAGED"},
    {0x10000000, "MEM_SHARED"},
    {SECTION_MEM_EXECUTE, "MEM_EXECUTE"},
    {SECTION_MEM_READ, "MEM_READ"},
    {SECTION_MEM_WRITE, "MEM_WRITE"},
}};

static std::vector<std::string> decode_flags(std::uint32_t value, const auto& table) {
  std::vector<std::string> out;
  for (const FlagName& f : table) {
    if ((value & f.value) == f.value) out.emplace_back(f.name);
  }
  return out;
}

std::string machine_name(std::uint16_t machine) {
  switch (machine) {
    case 0x0000: return "UNKNOWN";
    case 0x014c: return "I386";
    case 0x0162: return "R3000";
    case 0x0166: return "R4000";
    case 0x0168: return "R10000";
    case 0x0169: return "WCEMIPSV2";
    case 0x0184: return "ALPHA";
    case 0x01a2: return "SH3";
    case 0x01a3: return "SH3DSP";
    case 0x01a6: return "SH4";
    case 0x01a8: return "SH5";
    case 0x01c0: return "ARM";
    case 0x01c2: return "THUMB";
    case 0x01c4: return "ARMNT";
    case 0x01d3: return "AM33";
    case 0x01f0: return "POWERPC";
    case 0x01f1: return "POWERPCFP";
    case 0x0200: return "IA64";
    case 0x0266: return "MIPS16";
    case 0x0284: return "ALPHA64";
    case 0x0366: return "MIPSFPU";
    case 0x0466: return "MIPSFPU16";
    case 0x0ebc: return "EBC";
    case 0x5032: return "RISCV32";
    case 0x5064: return "RISCV64";
    case 0x5128: return "RISCV128";
    case 0x6232: return "LOONGARCH32";
    case 0x6264: return "LOONGARCH64";
    case 0x8664: return "AMD64";
    case 0x9041: return "M32R";
    case 0xa641: return "ARM64EC";
    case 0xaa64: return "ARM64";
    case 0xc0ee: return "CEE";
  }
  return "UNKNOWN";
}

std::string subsystem_name(std::uint32_t subsystem) {
  switch (subsystem) {
    case 1: return "NATIVE";
    case 2: return "WINDOWS_GUI";
    case 3: return "WINDOWS_CUI";
    case 5: return "OS2_CUI";
    case 7: return "POSIX_CUI";
    case 8: return "NATIVE_WINDOWS";
    case 9: return "WINDOWS_CE_GUI";
    case 10: return "EFI_APPLICATION";
    case 11: return "EFI_BOOT_SERVICE_DRIVER";
    case 12: return "EFI_RUNTIME_DRIVER";
    case 13: return "EFI_ROM";
    case 14: return "XBOX";
    case 16: return "WINDOWS_BOOT_APPLICATION";
  }
  return "UNKNOWN";
}

std::string magic_name(std::uint32_t magic) {
  if (magic == PE32_MAGIC) return "PE32";
  if (magic == PE32_PLUS_MAGIC) return "PE32_PLUS";
  return "UNKNOWN";
}

std::vector<std::string> coff_characteristics_list(std::uint32_t characteristics) {
  return decode_flags(characteristics, COFF_CHARACTERISTICS);
}

std::vector<std::string> dll_characteristics_list(std::uint32_t characteristics) {
  return decode_flags(characteristics, DLL_CHARACTERISTICS);
}

std::vector<std::string> section_characteristics_list(std::uint32_t characteristics) {
  std::vector<std::string> out = decode_flags(characteristics, SECTION_CHARACTERISTICS);
  std::uint32_t align = (characteristics >> 20) & 0xfu;
  if (align >= 1 && align <= 14) {
    out.push_back("ALIGN_" + std::to_string(1u << (align - 1)) + "BYTES");
  }
  return out;
}

}
