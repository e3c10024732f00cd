/**
 * @file profile_assembler.hpp
 * @brief Forecast snapshot to per-site vertical profile pipeline.
 * @author Watosn
 */
#pragma once

#include <string>
#include <utility>
#include <vector>

#include "nwpprof/core/interfaces.hpp"
#include "nwpprof/profile/profile.hpp"
#include "nwpprof/profile/variable_catalog.hpp"

namespace nwpprof::profile {

/**
 * @brief Extraction output bundle.
 *
 * On any fatal status `series` is empty; partial runs are never returned.
 */
struct ExtractionResult {
  std::vector<SiteTimeSeries> series{};
  std::vector<double> pressure_coordinate_pa{};
  nwpprof::core::Status status{nwpprof::core::Status::Ok};
  std::string message{};
};

/**
 * @brief Assembles time/level profiles at target sites from gridded forecasts.
 */
class ProfileAssembler {
 public:
  /**
   * @brief Construct assembler with a variable configuration.
   * @param catalog Recognised variables, units and level types.
   */
  explicit ProfileAssembler(VariableCatalog catalog = VariableCatalog::ecmwf_open_data())
      : catalog_(std::move(catalog)) {}

  /**
   * @brief Extract profiles for every site from every snapshot.
   * @param snapshots Snapshot source; snapshot `i` must be lead hour `3 * i`.
   * @param run_date Forecast run date every field must carry.
   * @param sites Target coordinates; output series follow this order.
   * @return Extraction bundle with `status` set.
   */
  [[nodiscard]] ExtractionResult extract(const nwpprof::core::ISnapshotSource& snapshots,
                                         const nwpprof::core::CivilDate& run_date,
                                         const std::vector<nwpprof::core::SiteCoordinate>& sites) const;

  [[nodiscard]] const VariableCatalog& catalog() const noexcept { return catalog_; }

 private:
  VariableCatalog catalog_;
};

}  // namespace nwpprof::profile
