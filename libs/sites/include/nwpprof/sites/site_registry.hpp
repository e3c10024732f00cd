/**
 * @file site_registry.hpp
 * @brief Target site registry backed by a CSV export.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "nwpprof/core/types.hpp"

namespace nwpprof::sites {

/**
 * @brief One registered measurement site.
 */
struct SiteRecord {
  std::string id{};
  std::string name{};
  double lat_deg{};
  double lon_deg{};
};

/**
 * @brief Subset of a registry plus identifiers that were not found.
 */
struct SiteSelection {
  std::vector<SiteRecord> sites{};
  std::vector<std::string> unknown_ids{};
};

/**
 * @brief Site registry loaded from `id,name,latitude,longitude` rows.
 *
 * Rows with empty or non-numeric coordinates are dropped on load, so every
 * record handed on to extraction has a usable location.
 */
class SiteRegistry final {
 public:
  /**
   * @brief CSV registry configuration.
   */
  struct Config {
    std::filesystem::path csv_file{};
  };

  /**
   * @brief Factory helper that parses the CSV input.
   */
  static std::unique_ptr<SiteRegistry> Create(const Config& config);

  [[nodiscard]] nwpprof::core::Status status() const noexcept { return status_; }
  [[nodiscard]] const std::vector<SiteRecord>& sites() const noexcept { return sites_; }
  [[nodiscard]] std::size_t skipped_rows() const noexcept { return skipped_rows_; }

  /**
   * @brief Select sites by identifier, keeping registry order.
   * @param ids Requested identifiers; empty selects every site.
   */
  [[nodiscard]] SiteSelection select(const std::vector<std::string>& ids) const;

 private:
  SiteRegistry(std::vector<SiteRecord> sites, std::size_t skipped_rows, nwpprof::core::Status status)
      : sites_(std::move(sites)), skipped_rows_(skipped_rows), status_(status) {}

  std::vector<SiteRecord> sites_{};
  std::size_t skipped_rows_{};
  nwpprof::core::Status status_{nwpprof::core::Status::Ok};
};

/**
 * @brief Extract coordinates in site order.
 */
[[nodiscard]] std::vector<nwpprof::core::SiteCoordinate> coordinates(const std::vector<SiteRecord>& sites);

/**
 * @brief Split a comma-separated identifier list, dropping empty tokens.
 */
[[nodiscard]] std::vector<std::string> split_ids(const std::string& text);

}  // namespace nwpprof::sites
