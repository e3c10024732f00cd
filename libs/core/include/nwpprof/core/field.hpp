/**
 * @file field.hpp
 * @brief Decoded gridded forecast field.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <Eigen/Dense>

#include "nwpprof/core/types.hpp"

namespace nwpprof::core {

/**
 * @brief Vertical level family of a field.
 */
enum class LevelType : std::uint8_t {
  Surface,
  MeanSea,
  HeightAboveGround,
  DepthBelowLandLayer,
  Isobaric,
  Other,
};

/**
 * @brief Map a GRIB `typeOfLevel` name to a level type.
 * @note Both `isobaricInPa` and `isobaricInhPa` map to `Isobaric`; the
 *       pressure unit travels separately in `GriddedField::level_units`.
 */
inline LevelType level_type_from_name(std::string_view name) {
  if (name == "surface") {
    return LevelType::Surface;
  }
  if (name == "meanSea") {
    return LevelType::MeanSea;
  }
  if (name == "heightAboveGround") {
    return LevelType::HeightAboveGround;
  }
  if (name == "depthBelowLandLayer") {
    return LevelType::DepthBelowLandLayer;
  }
  if (name == "isobaricInPa" || name == "isobaricInhPa") {
    return LevelType::Isobaric;
  }
  return LevelType::Other;
}

/**
 * @brief True for level types whose values become per-site scalars.
 */
inline bool is_surface_type(LevelType type) {
  return type == LevelType::Surface || type == LevelType::MeanSea || type == LevelType::HeightAboveGround ||
         type == LevelType::DepthBelowLandLayer;
}

/**
 * @brief One decoded forecast message over the full grid.
 *
 * `values` rows follow `latitudes_deg` and columns follow `longitudes_deg`;
 * both coordinate arrays are distinct and ascending.
 */
struct GriddedField {
  std::string short_name{};
  LevelType level_type{LevelType::Other};
  double level{};
  std::string level_units{};
  CivilDate date{};
  int forecast_hour{};
  std::string units{};
  std::string grid_type{};
  std::vector<double> latitudes_deg{};
  std::vector<double> longitudes_deg{};
  double lon_increment_deg{};
  Eigen::MatrixXd values{};
};

/**
 * @brief All fields decoded from one forecast lead hour.
 */
using Snapshot = std::vector<GriddedField>;

}  // namespace nwpprof::core
