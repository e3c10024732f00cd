/**
 * @file profile_writer.hpp
 * @brief Serialization interface for per-site profile time series.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <string>

#include "nwpprof/core/types.hpp"
#include "nwpprof/profile/profile.hpp"

namespace nwpprof::io {

/**
 * @brief Run and site metadata written alongside one time series.
 */
struct OutputContext {
  nwpprof::core::CivilDate date{};
  std::string site_id{};
  std::string site_name{};
  std::filesystem::path directory{};
  std::string source{"ECMWF open data"};
  std::string model_tag{"ecmwf-open"};
};

/**
 * @brief Written file path with status.
 */
struct WriteResult {
  std::filesystem::path path{};
  nwpprof::core::Status status{nwpprof::core::Status::Ok};
  std::string message{};
};

/**
 * @brief Interface for profile output containers.
 */
class IProfileWriter {
 public:
  virtual ~IProfileWriter() = default;
  /**
   * @brief Write one site's time series.
   * @param series Profiles of one site, time ordered.
   * @param context Run/site metadata; the file goes into `context.directory`.
   * @return Written path with `status` set.
   */
  [[nodiscard]] virtual WriteResult write(const nwpprof::profile::SiteTimeSeries& series,
                                          const OutputContext& context) const = 0;
};

/**
 * @brief File name without extension: `YYYYMMDD_<site>_<model>`.
 */
[[nodiscard]] std::string output_stem(const OutputContext& context);

/**
 * @brief CF time units: hours since the run date at midnight UTC.
 */
[[nodiscard]] std::string time_units(const nwpprof::core::CivilDate& date);

/**
 * @brief Producer version stamped into every output.
 */
[[nodiscard]] const char* producer_version();

}  // namespace nwpprof::io
