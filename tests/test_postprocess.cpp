#include <catch2/catch.hpp>

#include "postprocess.h"

#include <cmath>
#include <vector>

using namespace pefeat;

TEST_CASE("signed log transform", "[postprocess]") {
  std::vector<float> v = {0.0f, 1.0f, -1.0f, static_cast<float>(std::exp(1.0) - 1.0)};
  auto out = log_transform(v);
  REQUIRE(out.size() == v.size());
  CHECK(out[0] == 0.0f);
  CHECK(out[1] == Approx(std::log(2.0)));
  CHECK(out[2] == Approx(-std::log(2.0)));
  CHECK(out[3] == Approx(1.0));
  // the copy leaves its input alone
  CHECK(v[1] == 1.0f);

  log_transform_inplace(v);
  CHECK(v == out);
}
