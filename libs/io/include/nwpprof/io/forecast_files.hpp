/**
 * @file forecast_files.hpp
 * @brief Local layout of ECMWF open-data forecast files.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nwpprof/core/types.hpp"

namespace nwpprof::io {

/**
 * @brief Ordered forecast files of one run.
 */
struct ForecastFiles {
  std::vector<std::filesystem::path> files{};
  std::vector<std::filesystem::path> missing{};
  nwpprof::core::Status status{nwpprof::core::Status::Ok};
  std::string message{};
};

/**
 * @brief Open-data stream of a run: `oper` for 00/12 UTC, `scda` for 06/18 UTC.
 */
[[nodiscard]] std::string ecmwf_stream(int run_hour);

/**
 * @brief File name `YYYYMMDDRR0000-<h>h-<stream>-fc.grib2`.
 */
[[nodiscard]] std::string ecmwf_open_data_name(const nwpprof::core::CivilDate& date, int run_hour, int lead_hour);

/**
 * @brief Expected files of one run, lead hours from the run hour to 24 h in 3 h steps.
 * @param date Run date (UTC).
 * @param run_hour 0, 6, 12 or 18.
 * @param directory Directory holding the downloaded files.
 * @return Every expected path in `files`; paths that do not exist are also
 *         listed in `missing` and set `status` to DataUnavailable.
 */
[[nodiscard]] ForecastFiles ecmwf_open_data_files(const nwpprof::core::CivilDate& date, int run_hour,
                                                  const std::filesystem::path& directory);

}  // namespace nwpprof::io
