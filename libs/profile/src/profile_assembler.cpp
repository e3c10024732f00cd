/**
 * @file profile_assembler.cpp
 * @brief Forecast snapshot to per-site vertical profile pipeline implementation.
 * @author Watosn
 */

#include "nwpprof/profile/profile_assembler.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>

#include <fmt/format.h>

#include "nwpprof/core/constants.hpp"
#include "nwpprof/grid/grid_locator.hpp"
#include "nwpprof/thermo/derivations.hpp"

namespace nwpprof::profile {
namespace {

using nwpprof::core::CivilDate;
using nwpprof::core::GriddedField;
using nwpprof::core::Status;

struct PressureLevel {
  double pressure_pa{};
  LevelSlot slot{};
  Eigen::ArrayXd values{};
};

struct SurfaceColumn {
  bool present{};
  Eigen::ArrayXd values{};
};

using SurfaceColumns = std::array<SurfaceColumn, kSurfaceSlotCount>;
using LevelArrays = std::array<Eigen::ArrayXd, kLevelSlotCount>;

ExtractionResult failure(Status status, std::string message) {
  ExtractionResult out{};
  out.status = status;
  out.message = std::move(message);
  return out;
}

std::string format_date(const CivilDate& d) { return fmt::format("{:04d}-{:02d}-{:02d}", d.year, d.month, d.day); }

double level_pressure_pa(const GriddedField& field) {
  return field.level_units == "hPa" ? field.level * nwpprof::core::constants::kHpaToPa : field.level;
}

std::vector<double> distinct_descending(const std::vector<PressureLevel>& levels) {
  std::vector<double> pressures;
  pressures.reserve(levels.size());
  for (const auto& level : levels) {
    pressures.push_back(level.pressure_pa);
  }
  std::sort(pressures.begin(), pressures.end(), std::greater<>());
  pressures.erase(std::unique(pressures.begin(), pressures.end()), pressures.end());
  return pressures;
}

std::optional<std::size_t> coordinate_index(const std::vector<double>& coordinate, double pressure_pa) {
  const auto it = std::find(coordinate.begin(), coordinate.end(), pressure_pa);
  if (it == coordinate.end()) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(std::distance(coordinate.begin(), it));
}

Eigen::ArrayXd as_array(const std::vector<double>& v) {
  return Eigen::Map<const Eigen::ArrayXd>(v.data(), static_cast<Eigen::Index>(v.size()));
}

void derive(Profile& p, const Eigen::ArrayXd& geopotential_height_m) {
  p.height_m = nwpprof::thermo::geometric_height(geopotential_height_m);
  p.wwind_mps = nwpprof::thermo::vertical_wind(p.height_m, p.surface.pressure_pa, p.pressure_pa, p.omega_pa_s);
  p.rh = nwpprof::thermo::relative_humidity(p.pressure_pa, p.temperature_k, p.specific_humidity);
}

Profile build_profile(int hour,
                      std::size_t site,
                      const SurfaceColumns& surface,
                      const std::vector<PressureLevel>& levels,
                      const std::vector<std::size_t>& level_index,
                      const std::vector<double>& coordinate) {
  const auto n = static_cast<Eigen::Index>(coordinate.size());
  const auto j = static_cast<Eigen::Index>(site);

  LevelArrays arrays{};
  for (auto& a : arrays) {
    a = Eigen::ArrayXd::Constant(n, kNotAvailable);
  }
  for (std::size_t k = 0; k < levels.size(); ++k) {
    arrays[static_cast<std::size_t>(levels[k].slot)](static_cast<Eigen::Index>(level_index[k])) = levels[k].values(j);
  }

  Profile p{};
  p.time_h = static_cast<double>(hour);
  for (std::size_t s = 0; s < kSurfaceSlotCount; ++s) {
    if (surface[s].present) {
      surface_value(p.surface, static_cast<SurfaceSlot>(s)) = surface[s].values(j);
    }
  }
  p.pressure_pa = as_array(coordinate);
  p.temperature_k = arrays[static_cast<std::size_t>(LevelSlot::Temperature)];
  p.wind_u_mps = arrays[static_cast<std::size_t>(LevelSlot::WindU)];
  p.wind_v_mps = arrays[static_cast<std::size_t>(LevelSlot::WindV)];
  p.omega_pa_s = arrays[static_cast<std::size_t>(LevelSlot::Omega)];
  p.specific_humidity = arrays[static_cast<std::size_t>(LevelSlot::SpecificHumidity)];
  derive(p, arrays[static_cast<std::size_t>(LevelSlot::GeopotentialHeight)]);
  return p;
}

// Profiles appended before any snapshot carried isobaric data get the run coordinate with all levels missing.
void backfill(Profile& p, const std::vector<double>& coordinate) {
  const auto n = static_cast<Eigen::Index>(coordinate.size());
  const Eigen::ArrayXd missing = Eigen::ArrayXd::Constant(n, kNotAvailable);
  p.pressure_pa = as_array(coordinate);
  p.temperature_k = missing;
  p.wind_u_mps = missing;
  p.wind_v_mps = missing;
  p.omega_pa_s = missing;
  p.specific_humidity = missing;
  derive(p, missing);
}

}  // namespace

ExtractionResult ProfileAssembler::extract(const nwpprof::core::ISnapshotSource& snapshots,
                                           const CivilDate& run_date,
                                           const std::vector<nwpprof::core::SiteCoordinate>& sites) const {
  if (sites.empty()) {
    return failure(Status::InvalidInput, "no sites to extract");
  }

  std::optional<nwpprof::grid::GridLocation> location{};
  std::optional<std::vector<double>> coordinate{};
  std::vector<SiteTimeSeries> series(sites.size());

  for (std::size_t i = 0; i < snapshots.size(); ++i) {
    const int hour = nwpprof::core::constants::kLeadHourStepH * static_cast<int>(i);

    SurfaceColumns surface{};
    std::vector<PressureLevel> levels{};
    std::optional<ExtractionResult> fatal{};

    // Only the per-site samples outlive the callback.
    const auto loaded = snapshots.for_each_field(i, [&](const GriddedField& field) {
      const VariableSpec* spec = catalog_.find(field.short_name);
      if (spec == nullptr || !catalog_.recognizes(field.level_type)) {
        return true;
      }

      if (!location.has_value()) {
        auto located = nwpprof::grid::locate(field, sites);
        if (located.status != Status::Ok) {
          fatal = failure(located.status, located.message);
          return false;
        }
        location = std::move(located);
      } else if (!nwpprof::grid::same_grid(*location, field)) {
        fatal = failure(Status::GridMismatch,
                        fmt::format("{} at lead hour {} is not on the run grid", field.short_name, hour));
        return false;
      }

      if (field.date != run_date || field.forecast_hour != hour) {
        fatal = failure(Status::TimeMismatch,
                        fmt::format("Invalid time: expected {} +{}h but {} has {} +{}h", format_date(run_date), hour,
                                    field.short_name, format_date(field.date), field.forecast_hour));
        return false;
      }
      if (field.units != spec->units) {
        fatal = failure(Status::UnitMismatch, fmt::format("Expected {} to have units {} but received {}",
                                                          field.short_name, spec->units, field.units));
        return false;
      }

      if (nwpprof::core::is_surface_type(field.level_type)) {
        if (spec->surface_slot.has_value()) {
          auto& column = surface[static_cast<std::size_t>(*spec->surface_slot)];
          column.present = true;
          column.values = nwpprof::grid::sample_sites(*location, field);
        }
      } else if (spec->level_slot.has_value()) {
        levels.push_back(PressureLevel{.pressure_pa = level_pressure_pa(field),
                                       .slot = *spec->level_slot,
                                       .values = nwpprof::grid::sample_sites(*location, field)});
      }
      return true;
    });
    if (fatal.has_value()) {
      return std::move(*fatal);
    }
    if (loaded.status != Status::Ok) {
      return failure(loaded.status, loaded.message);
    }

    if (!coordinate.has_value() && !levels.empty()) {
      coordinate = distinct_descending(levels);
    }
    const std::vector<double> no_levels{};
    const std::vector<double>& pressures = coordinate.has_value() ? *coordinate : no_levels;

    std::vector<std::size_t> level_index;
    level_index.reserve(levels.size());
    for (const auto& level : levels) {
      const auto idx = coordinate_index(pressures, level.pressure_pa);
      if (!idx.has_value()) {
        return failure(Status::PressureCoordinateDrift,
                       fmt::format("pressure level {} Pa at lead hour {} is not in the run pressure coordinate",
                                   level.pressure_pa, hour));
      }
      level_index.push_back(*idx);
    }

    for (std::size_t j = 0; j < sites.size(); ++j) {
      series[j].profiles.push_back(build_profile(hour, j, surface, levels, level_index, pressures));
    }
  }

  if (!location.has_value()) {
    return failure(Status::DataUnavailable, "no recognised fields in any snapshot");
  }

  ExtractionResult out{};
  for (std::size_t j = 0; j < sites.size(); ++j) {
    auto& s = series[j];
    s.lat_deg = location->points[j].lat_deg;
    s.lon_deg = location->points[j].lon_deg;
    s.horizontal_resolution_km = location->resolution_km;
    if (coordinate.has_value()) {
      for (auto& p : s.profiles) {
        if (p.pressure_pa.size() != static_cast<Eigen::Index>(coordinate->size())) {
          backfill(p, *coordinate);
        }
      }
    }
  }
  out.series = std::move(series);
  if (coordinate.has_value()) {
    out.pressure_coordinate_pa = std::move(*coordinate);
  }
  return out;
}

}  // namespace nwpprof::profile
