#include "postprocess.h"

#include <cmath>

namespace pefeat {

static float signed_log1p(float x) {
  if (x > 0.0f) return std::log1p(x);
  if (x < 0.0f) return -std::log1p(-x);
  return x;
}

void log_transform_inplace(std::vector<float>& v) {
  for (float& x : v) x = signed_log1p(x);
}

std::vector<float> log_transform(const std::vector<float>& v) {
  std::vector<float> out = v;
  log_transform_inplace(out);
  return out;
}

}
