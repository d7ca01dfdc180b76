#pragma once

#include <vector>

namespace pefeat {

// Signed log transform applied before storing vectors for training:
// x > 0 -> log(1 + x), x < 0 -> -log(1 - x), 0 unchanged.
void log_transform_inplace(std::vector<float>& v);
std::vector<float> log_transform(const std::vector<float>& v);

}
