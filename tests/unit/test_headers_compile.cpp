#include "mrac/all.hpp"
#include <type_traits>
#include <cstring>
#include <cassert>

int main() {
  // Basic API smoke
  mrac::Dims d{.ny=1,.nu=1,.nx=1};
  (void)d;
  static_assert(std::is_same_v<mrac::Scalar,double>);
  static_assert(std::is_abstract_v<mrac::IPlant>);
  static_assert(std::is_abstract_v<mrac::integrators::IStepIntegrator>);
  static_assert(!std::is_copy_constructible_v<mrac::adaptive::AdaptiveLoopScheduler>);

  assert(std::strcmp(mrac_version_string(), mrac::kVersionStr) == 0);
  return 0;
}
