/**
 * @file variable_catalog.cpp
 * @brief Variable catalogue implementation.
 * @author Watosn
 */

#include "nwpprof/profile/variable_catalog.hpp"

#include <algorithm>

namespace nwpprof::profile {

VariableCatalog VariableCatalog::ecmwf_open_data() {
  using nwpprof::core::LevelType;
  std::vector<VariableSpec> variables{
      {.short_name = "10u", .units = "m s**-1", .surface_slot = SurfaceSlot::WindU10m},
      {.short_name = "10v", .units = "m s**-1", .surface_slot = SurfaceSlot::WindV10m},
      {.short_name = "2d", .units = "K", .surface_slot = SurfaceSlot::DewpointTemp2m},
      {.short_name = "2t", .units = "K", .surface_slot = SurfaceSlot::Temp2m},
      {.short_name = "gh", .units = "gpm", .level_slot = LevelSlot::GeopotentialHeight},
      {.short_name = "msl", .units = "Pa", .surface_slot = SurfaceSlot::PressureAmsl},
      {.short_name = "q", .units = "kg kg**-1", .level_slot = LevelSlot::SpecificHumidity},
      {.short_name = "sp", .units = "Pa", .surface_slot = SurfaceSlot::Pressure},
      {.short_name = "st", .units = "K", .surface_slot = SurfaceSlot::SoilTemperature},
      {.short_name = "t", .units = "K", .level_slot = LevelSlot::Temperature},
      {.short_name = "u", .units = "m s**-1", .level_slot = LevelSlot::WindU},
      {.short_name = "v", .units = "m s**-1", .level_slot = LevelSlot::WindV},
      {.short_name = "w", .units = "Pa s**-1", .level_slot = LevelSlot::Omega},
  };
  std::vector<LevelType> level_types{LevelType::Surface, LevelType::MeanSea, LevelType::HeightAboveGround,
                                     LevelType::DepthBelowLandLayer, LevelType::Isobaric};
  return VariableCatalog(std::move(variables), std::move(level_types));
}

const VariableSpec* VariableCatalog::find(std::string_view short_name) const noexcept {
  const auto it = std::find_if(variables_.begin(), variables_.end(),
                               [short_name](const VariableSpec& v) { return v.short_name == short_name; });
  return it == variables_.end() ? nullptr : &*it;
}

bool VariableCatalog::recognizes(nwpprof::core::LevelType level_type) const noexcept {
  return std::find(level_types_.begin(), level_types_.end(), level_type) != level_types_.end();
}

}  // namespace nwpprof::profile
