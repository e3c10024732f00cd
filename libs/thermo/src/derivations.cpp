/**
 * @file derivations.cpp
 * @brief Derived thermodynamic and kinematic quantities implementation.
 * @author Watosn
 */

#include "nwpprof/thermo/derivations.hpp"

#include <cmath>
#include <limits>

#include "nwpprof/core/constants.hpp"

namespace nwpprof::thermo {
namespace {

using nwpprof::core::constants::kEarthRadiusIfsM;
using nwpprof::core::constants::kHpaToPa;
using nwpprof::core::constants::kMolecularWeightRatio;
using nwpprof::core::constants::kTriplePointK;

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

Eigen::ArrayXd exp10(const Eigen::ArrayXd& x) { return (x * std::log(10.0)).exp(); }

}  // namespace

Eigen::ArrayXd geometric_height(const Eigen::ArrayXd& geopotential_height_m) {
  return kEarthRadiusIfsM * geopotential_height_m / (kEarthRadiusIfsM - geopotential_height_m);
}

Eigen::ArrayXd vertical_wind(const Eigen::ArrayXd& height_m,
                             const double sfc_pressure_pa,
                             const Eigen::ArrayXd& pressure_pa,
                             const Eigen::ArrayXd& omega_pa_s) {
  const Eigen::Index n = pressure_pa.size();
  if (height_m.size() != n || omega_pa_s.size() != n) {
    return Eigen::ArrayXd::Constant(n, kNaN);
  }
  if (n == 0) {
    return Eigen::ArrayXd{};
  }

  Eigen::ArrayXd dz(n);
  Eigen::ArrayXd dp(n);
  dz(0) = height_m(0);
  dp(0) = pressure_pa(0) - sfc_pressure_pa;
  dz.tail(n - 1) = height_m.tail(n - 1) - height_m.head(n - 1);
  dp.tail(n - 1) = pressure_pa.tail(n - 1) - pressure_pa.head(n - 1);

  Eigen::ArrayXd w = omega_pa_s * dz / dp;
  for (Eigen::Index i = 0; i < n; ++i) {
    if (!std::isfinite(w(i))) {
      w(i) = kNaN;
    }
  }
  return w;
}

Eigen::ArrayXd saturation_vapor_pressure(const Eigen::ArrayXd& temperature_k) {
  const Eigen::ArrayXd ratio = kTriplePointK / temperature_k;
  const Eigen::ArrayXd inv_ratio = temperature_k / kTriplePointK;

  const Eigen::ArrayXd liquid =
      kHpaToPa * exp10(10.79574 * (1.0 - ratio) - 5.02800 * inv_ratio.log10() +
                       1.50475e-4 * (1.0 - exp10(-8.2969 * (inv_ratio - 1.0))) +
                       0.42873e-3 * (exp10(4.76955 * (1.0 - ratio)) - 1.0) + 0.78614);
  const Eigen::ArrayXd ice =
      kHpaToPa * exp10(-9.09718 * (ratio - 1.0) - 3.56654 * ratio.log10() + 0.876793 * (1.0 - inv_ratio) +
                       std::log10(6.1071));

  // NaN compares false and falls through to the liquid branch, which is NaN as well.
  return (temperature_k < kTriplePointK).select(ice, liquid);
}

Eigen::ArrayXd vapor_pressure(const Eigen::ArrayXd& pressure_pa, const Eigen::ArrayXd& specific_humidity) {
  return specific_humidity * pressure_pa / (kMolecularWeightRatio + (1.0 - kMolecularWeightRatio) * specific_humidity);
}

Eigen::ArrayXd relative_humidity(const Eigen::ArrayXd& pressure_pa,
                                 const Eigen::ArrayXd& temperature_k,
                                 const Eigen::ArrayXd& specific_humidity) {
  return vapor_pressure(pressure_pa, specific_humidity) / saturation_vapor_pressure(temperature_k);
}

}  // namespace nwpprof::thermo
