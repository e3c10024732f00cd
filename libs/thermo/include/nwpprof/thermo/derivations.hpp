/**
 * @file derivations.hpp
 * @brief Derived thermodynamic and kinematic quantities on pressure levels.
 * @author Watosn
 *
 * All functions are element-wise over Eigen arrays and free of state. NaN
 * inputs propagate to NaN outputs.
 */
#pragma once

#include <Eigen/Dense>

namespace nwpprof::thermo {

/**
 * @brief Convert geopotential height to geometric height.
 * @param geopotential_height_m Geopotential height (m).
 * @return Geometric height (m).
 * @note ECMWF (2023), ERA5: compute pressure and geopotential on model levels,
 *       geopotential height and geometric height.
 */
[[nodiscard]] Eigen::ArrayXd geometric_height(const Eigen::ArrayXd& geopotential_height_m);

/**
 * @brief Convert vertical wind from pressure to cartesian coordinates.
 * @param height_m Height of each level (m), surface-to-top order.
 * @param sfc_pressure_pa Surface pressure (Pa).
 * @param pressure_pa Level pressures (Pa), surface-to-top order.
 * @param omega_pa_s Vertical wind in pressure coordinates (Pa s-1).
 * @return Vertical wind (m s-1), `omega * dz / dp`.
 *
 * `dz` prepends a zero height and `dp` prepends the surface pressure. A
 * non-finite quotient (dp == 0) is reported as NaN.
 */
[[nodiscard]] Eigen::ArrayXd vertical_wind(const Eigen::ArrayXd& height_m,
                                           double sfc_pressure_pa,
                                           const Eigen::ArrayXd& pressure_pa,
                                           const Eigen::ArrayXd& omega_pa_s);

/**
 * @brief Saturation vapour pressure over liquid at or above the triple point
 *        and over ice below it (Goff-Gratch).
 * @param temperature_k Temperature (K).
 * @return Saturation vapour pressure (Pa).
 * @note Voemel, H. (2016). Saturation vapor pressure formulations.
 */
[[nodiscard]] Eigen::ArrayXd saturation_vapor_pressure(const Eigen::ArrayXd& temperature_k);

/**
 * @brief Partial pressure of water vapour.
 * @param pressure_pa Air pressure (Pa).
 * @param specific_humidity Specific humidity (kg kg-1).
 * @return Vapour pressure (Pa).
 */
[[nodiscard]] Eigen::ArrayXd vapor_pressure(const Eigen::ArrayXd& pressure_pa, const Eigen::ArrayXd& specific_humidity);

/**
 * @brief Relative humidity (1) with respect to liquid above freezing and ice below.
 */
[[nodiscard]] Eigen::ArrayXd relative_humidity(const Eigen::ArrayXd& pressure_pa,
                                               const Eigen::ArrayXd& temperature_k,
                                               const Eigen::ArrayXd& specific_humidity);

}  // namespace nwpprof::thermo
