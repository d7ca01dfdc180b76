#pragma once

#include "pefeat_internal.h"

#include <optional>
#include <string>

namespace pefeat {

Config config_from_api(
    int feature_version,
    unsigned int entropy_window,
    unsigned int entropy_step,
    int print_feature_warning);

void validate_config(const Config& cfg);

std::optional<std::string> getenv_string(const char* name);

}
