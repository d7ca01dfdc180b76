#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace pefeat {

// Named "pefeat" logger on stderr, created on first use.
std::shared_ptr<spdlog::logger> logger();

// One-time process setup: sets the pefeat logger level and silences the
// parser library's own logging. Call from main() or the C API initializer.
void init_logging(spdlog::level::level_enum level);

// trace, debug, info, warn, error, critical, off (case-insensitive)
bool parse_level(const std::string& name, spdlog::level::level_enum& out);

}
