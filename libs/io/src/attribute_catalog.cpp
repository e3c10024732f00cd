/**
 * @file attribute_catalog.cpp
 * @brief Output variable attribute table.
 * @author Watosn
 */

#include "nwpprof/io/attribute_catalog.hpp"

namespace nwpprof::io {

const std::vector<VariableAttributes>& profile_attributes() {
  static const std::vector<VariableAttributes> kAttributes{
      {.name = "latitude", .units = "degree_north", .long_name = "Latitude of model gridpoint",
       .standard_name = "latitude"},
      {.name = "longitude", .units = "degree_east", .long_name = "Longitude of model gridpoint",
       .standard_name = "longitude"},
      {.name = "horizontal_resolution", .units = "km", .long_name = "Horizontal resolution of model"},
      {.name = "sfc_pressure", .units = "Pa", .long_name = "Surface pressure", .dimensions = Dimensions::Time,
       .standard_name = "surface_air_pressure"},
      {.name = "sfc_pressure_amsl", .units = "Pa", .long_name = "Surface pressure at mean sea level",
       .dimensions = Dimensions::Time},
      {.name = "sfc_temp_2m", .units = "K", .long_name = "Temperature at 2m", .dimensions = Dimensions::Time},
      {.name = "sfc_dewpoint_temp_2m", .units = "K", .long_name = "Dew point temperature at 2m",
       .dimensions = Dimensions::Time},
      {.name = "sfc_wind_u_10m", .units = "m s-1", .long_name = "Zonal wind at 10 m", .dimensions = Dimensions::Time},
      {.name = "sfc_wind_v_10m", .units = "m s-1", .long_name = "Meridional wind at 10 m",
       .dimensions = Dimensions::Time},
      {.name = "soil_temperature", .units = "K", .long_name = "Soil temperature", .dimensions = Dimensions::Time},
      {.name = "pressure", .units = "Pa", .long_name = "Pressure", .dimensions = Dimensions::TimeLevel,
       .standard_name = "air_pressure"},
      {.name = "temperature", .units = "K", .long_name = "Temperature", .dimensions = Dimensions::TimeLevel,
       .standard_name = "air_temperature"},
      {.name = "uwind", .units = "m s-1", .long_name = "Zonal wind", .dimensions = Dimensions::TimeLevel,
       .standard_name = "eastward_wind"},
      {.name = "vwind", .units = "m s-1", .long_name = "Meridional wind", .dimensions = Dimensions::TimeLevel,
       .standard_name = "northward_wind"},
      {.name = "wwind", .units = "m s-1", .long_name = "Vertical wind", .dimensions = Dimensions::TimeLevel,
       .standard_name = "upward_air_velocity",
       .comment = "The vertical wind has been calculated from omega (Pa s-1), height and pressure using: "
                  "w=omega*dz/dp"},
      {.name = "omega", .units = "Pa s-1", .long_name = "Vertical wind in pressure coordinates",
       .dimensions = Dimensions::TimeLevel, .standard_name = "omega"},
      {.name = "rh", .units = "1", .long_name = "Relative humidity", .dimensions = Dimensions::TimeLevel,
       .standard_name = "relative_humidity",
       .comment = "With respect to liquid above 0 degrees C and with respect to ice below 0 degrees C. "
                  "Calculated using Goff-Gratch formula."},
      {.name = "q", .units = "1", .long_name = "Specific humidity", .dimensions = Dimensions::TimeLevel,
       .standard_name = "specific_humidity"},
      {.name = "height", .units = "m", .long_name = "Height above ground", .dimensions = Dimensions::TimeLevel,
       .comment = "Calculated from geopotential height"},
  };
  return kAttributes;
}

}  // namespace nwpprof::io
