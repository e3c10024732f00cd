/**
 * @file profile.hpp
 * @brief Per-site vertical profile records.
 * @author Watosn
 */
#pragma once

#include <limits>
#include <optional>
#include <string_view>
#include <vector>

#include <Eigen/Dense>

#include "nwpprof/profile/variable_catalog.hpp"

namespace nwpprof::profile {

inline constexpr double kNotAvailable = std::numeric_limits<double>::quiet_NaN();

/**
 * @brief Surface-type scalars of one profile. NaN marks "not available".
 */
struct SurfaceValues {
  double pressure_pa{kNotAvailable};
  double pressure_amsl_pa{kNotAvailable};
  double temp_2m_k{kNotAvailable};
  double dewpoint_temp_2m_k{kNotAvailable};
  double wind_u_10m_mps{kNotAvailable};
  double wind_v_10m_mps{kNotAvailable};
  double soil_temperature_k{kNotAvailable};
};

/**
 * @brief Mutable reference to the scalar behind a surface slot.
 */
[[nodiscard]] double& surface_value(SurfaceValues& values, SurfaceSlot slot);

/**
 * @brief One site at one forecast lead hour.
 *
 * Every array is aligned to `pressure_pa`, which is sorted descending
 * (surface to top) and identical for all profiles of a run.
 */
struct Profile {
  double time_h{};
  SurfaceValues surface{};
  Eigen::ArrayXd pressure_pa{};
  Eigen::ArrayXd temperature_k{};
  Eigen::ArrayXd wind_u_mps{};
  Eigen::ArrayXd wind_v_mps{};
  Eigen::ArrayXd omega_pa_s{};
  Eigen::ArrayXd specific_humidity{};
  Eigen::ArrayXd height_m{};
  Eigen::ArrayXd wwind_mps{};
  Eigen::ArrayXd rh{};
};

/**
 * @brief Time-ordered profiles of one site plus its snapped grid point.
 */
struct SiteTimeSeries {
  double lat_deg{};
  double lon_deg{};
  double horizontal_resolution_km{};
  std::vector<Profile> profiles{};
};

/**
 * @brief Look up a surface scalar by output variable name.
 * @return Value, or nullopt when `name` is not a surface variable.
 */
[[nodiscard]] std::optional<double> surface_variable(const Profile& profile, std::string_view name);

/**
 * @brief Look up a pressure-level array by output variable name.
 * @return Pointer into `profile`, or nullptr when `name` is not a level variable.
 */
[[nodiscard]] const Eigen::ArrayXd* level_variable(const Profile& profile, std::string_view name);

}  // namespace nwpprof::profile
