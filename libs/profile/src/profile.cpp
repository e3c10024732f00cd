/**
 * @file profile.cpp
 * @brief Profile record accessors.
 * @author Watosn
 */

#include "nwpprof/profile/profile.hpp"

namespace nwpprof::profile {

double& surface_value(SurfaceValues& values, SurfaceSlot slot) {
  switch (slot) {
    case SurfaceSlot::Pressure:
      return values.pressure_pa;
    case SurfaceSlot::PressureAmsl:
      return values.pressure_amsl_pa;
    case SurfaceSlot::Temp2m:
      return values.temp_2m_k;
    case SurfaceSlot::DewpointTemp2m:
      return values.dewpoint_temp_2m_k;
    case SurfaceSlot::WindU10m:
      return values.wind_u_10m_mps;
    case SurfaceSlot::WindV10m:
      return values.wind_v_10m_mps;
    case SurfaceSlot::SoilTemperature:
    default:
      return values.soil_temperature_k;
  }
}

std::optional<double> surface_variable(const Profile& profile, std::string_view name) {
  const auto& s = profile.surface;
  if (name == "sfc_pressure") {
    return s.pressure_pa;
  }
  if (name == "sfc_pressure_amsl") {
    return s.pressure_amsl_pa;
  }
  if (name == "sfc_temp_2m") {
    return s.temp_2m_k;
  }
  if (name == "sfc_dewpoint_temp_2m") {
    return s.dewpoint_temp_2m_k;
  }
  if (name == "sfc_wind_u_10m") {
    return s.wind_u_10m_mps;
  }
  if (name == "sfc_wind_v_10m") {
    return s.wind_v_10m_mps;
  }
  if (name == "soil_temperature") {
    return s.soil_temperature_k;
  }
  return std::nullopt;
}

const Eigen::ArrayXd* level_variable(const Profile& profile, std::string_view name) {
  if (name == "pressure") {
    return &profile.pressure_pa;
  }
  if (name == "temperature") {
    return &profile.temperature_k;
  }
  if (name == "uwind") {
    return &profile.wind_u_mps;
  }
  if (name == "vwind") {
    return &profile.wind_v_mps;
  }
  if (name == "omega") {
    return &profile.omega_pa_s;
  }
  if (name == "q") {
    return &profile.specific_humidity;
  }
  if (name == "height") {
    return &profile.height_m;
  }
  if (name == "wwind") {
    return &profile.wwind_mps;
  }
  if (name == "rh") {
    return &profile.rh;
  }
  return nullptr;
}

}  // namespace nwpprof::profile
