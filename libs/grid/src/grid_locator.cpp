/**
 * @file grid_locator.cpp
 * @brief Nearest-gridpoint lookup implementation.
 * @author Watosn
 */

#include "nwpprof/grid/grid_locator.hpp"

#include <array>
#include <cmath>
#include <numbers>
#include <utility>

#include <fmt/format.h>

#include "nwpprof/core/constants.hpp"

namespace nwpprof::grid {
namespace {

constexpr std::array<const char*, 4> kSupportedGridTypes{"regular_gg", "regular_ll", "reduced_gg", "reduced_ll"};

std::size_t nearest_index(const std::vector<double>& axis, double target) {
  std::size_t best = 0;
  double best_d = std::abs(axis[0] - target);
  for (std::size_t i = 1; i < axis.size(); ++i) {
    const double d = std::abs(axis[i] - target);
    if (d < best_d) {
      best_d = d;
      best = i;
    }
  }
  return best;
}

GridLocation failure(nwpprof::core::Status status, std::string message) {
  GridLocation out{};
  out.status = status;
  out.message = std::move(message);
  return out;
}

}  // namespace

bool is_supported_grid_type(const std::string& grid_type) {
  for (const char* t : kSupportedGridTypes) {
    if (grid_type == t) {
      return true;
    }
  }
  return false;
}

GridLocation locate(const nwpprof::core::GriddedField& field, const std::vector<nwpprof::core::SiteCoordinate>& sites) {
  if (!is_supported_grid_type(field.grid_type)) {
    return failure(nwpprof::core::Status::UnsupportedGrid, fmt::format("Not implemented for grid type {}", field.grid_type));
  }
  if (sites.empty()) {
    return failure(nwpprof::core::Status::InvalidInput, "no sites to locate");
  }
  const auto& lats = field.latitudes_deg;
  const auto& lons = field.longitudes_deg;
  if (lats.empty() || lons.empty()) {
    return failure(nwpprof::core::Status::InvalidInput, "grid has no coordinates");
  }
  if (static_cast<std::size_t>(field.values.rows()) != lats.size() ||
      static_cast<std::size_t>(field.values.cols()) != lons.size()) {
    return failure(nwpprof::core::Status::InvalidInput,
                   fmt::format("value grid {}x{} does not match {} latitudes and {} longitudes", field.values.rows(),
                               field.values.cols(), lats.size(), lons.size()));
  }

  double dlon_deg = field.lon_increment_deg;
  if (!(dlon_deg > 0.0) && lons.size() > 1) {
    dlon_deg = lons[1] - lons[0];
  }
  if (!(dlon_deg > 0.0)) {
    return failure(nwpprof::core::Status::InvalidInput, "cannot determine longitudinal increment");
  }

  GridLocation out{};
  out.n_lat = lats.size();
  out.n_lon = lons.size();
  out.grid_type = field.grid_type;
  const double res_m = dlon_deg / 360.0 * 2.0 * std::numbers::pi * nwpprof::core::constants::kEarthRadiusIfsM;
  out.resolution_km = std::round(res_m * nwpprof::core::constants::kMToKm);

  out.points.reserve(sites.size());
  for (const auto& site : sites) {
    const std::size_t i = nearest_index(lats, site.lat_deg);
    const std::size_t j = nearest_index(lons, site.lon_deg);
    out.points.push_back(SiteGridPoint{.lat_index = i, .lon_index = j, .lat_deg = lats[i], .lon_deg = lons[j]});
  }
  return out;
}

bool same_grid(const GridLocation& location, const nwpprof::core::GriddedField& field) {
  return field.grid_type == location.grid_type && static_cast<std::size_t>(field.values.rows()) == location.n_lat &&
         static_cast<std::size_t>(field.values.cols()) == location.n_lon;
}

Eigen::ArrayXd sample_sites(const GridLocation& location, const nwpprof::core::GriddedField& field) {
  Eigen::ArrayXd out(static_cast<Eigen::Index>(location.points.size()));
  for (std::size_t k = 0; k < location.points.size(); ++k) {
    const auto& p = location.points[k];
    out(static_cast<Eigen::Index>(k)) =
        field.values(static_cast<Eigen::Index>(p.lat_index), static_cast<Eigen::Index>(p.lon_index));
  }
  return out;
}

}  // namespace nwpprof::grid
