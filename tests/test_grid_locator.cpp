/**
 * @file test_grid_locator.cpp
 * @brief Nearest-gridpoint lookup tests.
 * @author Watosn
 */

#include <cmath>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "nwpprof/grid/grid_locator.hpp"

namespace {

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

nwpprof::core::GriddedField make_field(std::vector<double> lats, std::vector<double> lons, double dlon) {
  nwpprof::core::GriddedField f{};
  f.short_name = "2t";
  f.level_type = nwpprof::core::LevelType::HeightAboveGround;
  f.grid_type = "regular_ll";
  f.latitudes_deg = std::move(lats);
  f.longitudes_deg = std::move(lons);
  f.lon_increment_deg = dlon;
  const auto n_lat = static_cast<Eigen::Index>(f.latitudes_deg.size());
  const auto n_lon = static_cast<Eigen::Index>(f.longitudes_deg.size());
  f.values.resize(n_lat, n_lon);
  for (Eigen::Index i = 0; i < n_lat; ++i) {
    for (Eigen::Index j = 0; j < n_lon; ++j) {
      f.values(i, j) = 100.0 * static_cast<double>(i) + static_cast<double>(j);
    }
  }
  return f;
}

}  // namespace

int main() {
  using nwpprof::core::Status;

  const auto field = make_field({0.0, 1.0, 2.0}, {0.0, 1.0, 2.0, 3.0}, 1.0);
  const std::vector<nwpprof::core::SiteCoordinate> sites{
      {.lat_deg = 1.2, .lon_deg = 2.6}, {.lat_deg = 0.5, .lon_deg = 0.5}, {.lat_deg = 40.0, .lon_deg = -3.0}};

  const auto loc = nwpprof::grid::locate(field, sites);
  if (loc.status != Status::Ok || loc.points.size() != 3 || loc.n_lat != 3 || loc.n_lon != 4) {
    spdlog::error("locate failed: {}", loc.message);
    return 1;
  }
  if (loc.points[0].lat_index != 1 || loc.points[0].lon_index != 3 || !approx(loc.points[0].lat_deg, 1.0, 0.0) ||
      !approx(loc.points[0].lon_deg, 3.0, 0.0)) {
    spdlog::error("nearest point wrong: {} {}", loc.points[0].lat_index, loc.points[0].lon_index);
    return 2;
  }
  if (loc.points[1].lat_index != 0 || loc.points[1].lon_index != 0) {
    spdlog::error("ties must resolve to the lowest index");
    return 3;
  }
  if (loc.points[2].lat_index != 2 || loc.points[2].lon_index != 0) {
    spdlog::error("out-of-domain site must snap to the nearest edge");
    return 4;
  }
  if (!approx(loc.resolution_km, 111.0, 0.0)) {
    spdlog::error("resolution for 1 degree should be 111 km, got {}", loc.resolution_km);
    return 5;
  }

  const Eigen::ArrayXd sampled = nwpprof::grid::sample_sites(loc, field);
  if (sampled.size() != 3 || sampled(0) != 103.0 || sampled(1) != 0.0 || sampled(2) != 200.0) {
    spdlog::error("sampling returned wrong values");
    return 6;
  }

  const auto quarter = make_field({0.0, 0.25}, {0.0, 0.25, 0.5}, 0.25);
  const auto loc_quarter = nwpprof::grid::locate(quarter, {{.lat_deg = 0.1, .lon_deg = 0.1}});
  if (loc_quarter.status != Status::Ok || !approx(loc_quarter.resolution_km, 28.0, 0.0)) {
    spdlog::error("resolution for 0.25 degree should be 28 km, got {}", loc_quarter.resolution_km);
    return 7;
  }

  const auto no_increment = make_field({0.0, 0.5}, {10.0, 10.5, 11.0}, 0.0);
  const auto loc_fallback = nwpprof::grid::locate(no_increment, {{.lat_deg = 0.0, .lon_deg = 10.0}});
  if (loc_fallback.status != Status::Ok || !approx(loc_fallback.resolution_km, 56.0, 0.0)) {
    spdlog::error("increment fallback failed, got {}", loc_fallback.resolution_km);
    return 8;
  }

  auto rotated = field;
  rotated.grid_type = "rotated_ll";
  const auto loc_rotated = nwpprof::grid::locate(rotated, sites);
  if (loc_rotated.status != Status::UnsupportedGrid || loc_rotated.message != "Not implemented for grid type rotated_ll") {
    spdlog::error("unsupported grid not rejected: {}", loc_rotated.message);
    return 9;
  }
  for (const char* type : {"regular_gg", "regular_ll", "reduced_gg", "reduced_ll"}) {
    if (!nwpprof::grid::is_supported_grid_type(type)) {
      spdlog::error("{} must be supported", type);
      return 10;
    }
  }

  if (nwpprof::grid::locate(field, {}).status != Status::InvalidInput) {
    spdlog::error("empty site list must be rejected");
    return 11;
  }

  auto truncated = field;
  truncated.values.resize(2, 4);
  if (nwpprof::grid::locate(truncated, sites).status != Status::InvalidInput) {
    spdlog::error("value grid not matching coordinates must be rejected");
    return 12;
  }

  if (!nwpprof::grid::same_grid(loc, field) || nwpprof::grid::same_grid(loc, quarter)) {
    spdlog::error("same_grid comparison wrong");
    return 13;
  }

  return 0;
}
