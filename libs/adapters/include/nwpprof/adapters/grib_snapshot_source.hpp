/**
 * @file grib_snapshot_source.hpp
 * @brief Snapshot source backed by GRIB files decoded with ecCodes.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "nwpprof/core/interfaces.hpp"

namespace nwpprof::adapters {

/**
 * @brief One GRIB file per lead hour, decoded on demand.
 *
 * Every wanted message of a file becomes a `GriddedField` that lives only
 * for one visitor call. Rows are reordered to ascending latitude and columns
 * to ascending longitude whatever the scanning mode; reduced grids are
 * expanded to their longest row by nearest-longitude sampling from 0°.
 */
class GribSnapshotSource final : public nwpprof::core::ISnapshotSource {
 public:
  /**
   * @brief Configuration for GRIB source construction.
   */
  struct Config {
    std::vector<std::filesystem::path> files{};
    /// Short names to decode; messages with other names are skipped. Empty decodes all.
    std::vector<std::string> short_names{};
  };

  /**
   * @brief Factory helper; files are opened lazily by `load`.
   */
  static std::unique_ptr<GribSnapshotSource> Create(const Config& config);

  [[nodiscard]] std::size_t size() const override { return config_.files.size(); }

  /**
   * @brief Decode file `index` message by message.
   */
  [[nodiscard]] nwpprof::core::SnapshotLoad for_each_field(std::size_t index,
                                                           const nwpprof::core::FieldVisitor& visit) const override;

 private:
  class Impl;
  explicit GribSnapshotSource(Config config) : config_(std::move(config)) {}

  Config config_{};
  std::shared_ptr<Impl> impl_{};
};

}  // namespace nwpprof::adapters
