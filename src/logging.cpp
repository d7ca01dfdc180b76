#include "logging.h"

#include <LIEF/logging.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>

namespace pefeat {

std::shared_ptr<spdlog::logger> logger() {
  static std::shared_ptr<spdlog::logger> instance = [] {
    auto existing = spdlog::get("pefeat");
    if (existing) return existing;
    auto created = spdlog::stderr_color_mt("pefeat");
    created->set_level(spdlog::level::warn);
    return created;
  }();
  return instance;
}

void init_logging(spdlog::level::level_enum level) {
  logger()->set_level(level);
  LIEF::logging::disable();
}

bool parse_level(const std::string& name, spdlog::level::level_enum& out) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "trace") { out = spdlog::level::trace; return true; }
  if (lower == "debug") { out = spdlog::level::debug; return true; }
  if (lower == "info") { out = spdlog::level::info; return true; }
  if (lower == "warn" || lower == "warning") { out = spdlog::level::warn; return true; }
  if (lower == "error") { out = spdlog::level::err; return true; }
  if (lower == "critical") { out = spdlog::level::critical; return true; }
  if (lower == "off") { out = spdlog::level::off; return true; }
  return false;
}

}
