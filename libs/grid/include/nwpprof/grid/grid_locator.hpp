/**
 * @file grid_locator.hpp
 * @brief Nearest-gridpoint lookup for target sites.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "nwpprof/core/field.hpp"
#include "nwpprof/core/types.hpp"

namespace nwpprof::grid {

/**
 * @brief Snapped grid point of one site.
 */
struct SiteGridPoint {
  std::size_t lat_index{};
  std::size_t lon_index{};
  double lat_deg{};
  double lon_deg{};
};

/**
 * @brief Resolved site-to-grid mapping for a run.
 */
struct GridLocation {
  std::vector<SiteGridPoint> points{};
  std::size_t n_lat{};
  std::size_t n_lon{};
  std::string grid_type{};
  double resolution_km{};
  nwpprof::core::Status status{nwpprof::core::Status::Ok};
  std::string message{};
};

/**
 * @brief True for the regular/reduced Gaussian/lat-lon grid families.
 */
[[nodiscard]] bool is_supported_grid_type(const std::string& grid_type);

/**
 * @brief Locate the nearest grid point of every site.
 * @param field Any field on the run grid; its coordinate arrays must be distinct and ascending.
 * @param sites Target coordinates, non-empty.
 * @return Grid location with `status` set; ties go to the first (lowest) coordinate.
 */
[[nodiscard]] GridLocation locate(const nwpprof::core::GriddedField& field,
                                  const std::vector<nwpprof::core::SiteCoordinate>& sites);

/**
 * @brief Check that a field lies on the grid a location was resolved from.
 */
[[nodiscard]] bool same_grid(const GridLocation& location, const nwpprof::core::GriddedField& field);

/**
 * @brief Sample a field at every located site.
 */
[[nodiscard]] Eigen::ArrayXd sample_sites(const GridLocation& location, const nwpprof::core::GriddedField& field);

}  // namespace nwpprof::grid
