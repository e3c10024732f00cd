/**
 * @file forecast_files.cpp
 * @brief ECMWF open-data file naming.
 * @author Watosn
 */

#include "nwpprof/io/forecast_files.hpp"

#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "nwpprof/core/constants.hpp"
#include "nwpprof/core/time.hpp"

namespace nwpprof::io {
namespace {

constexpr int kLastLeadHour = 24;

bool is_valid_run(int run_hour) { return run_hour == 0 || run_hour == 6 || run_hour == 12 || run_hour == 18; }

}  // namespace

std::string ecmwf_stream(int run_hour) { return (run_hour == 0 || run_hour == 12) ? "oper" : "scda"; }

std::string ecmwf_open_data_name(const nwpprof::core::CivilDate& date, int run_hour, int lead_hour) {
  return fmt::format("{:04d}{:02d}{:02d}{:02d}0000-{}h-{}-fc.grib2", date.year, date.month, date.day, run_hour,
                     lead_hour, ecmwf_stream(run_hour));
}

ForecastFiles ecmwf_open_data_files(const nwpprof::core::CivilDate& date, int run_hour,
                                    const std::filesystem::path& directory) {
  ForecastFiles out{};
  if (!nwpprof::core::is_valid_date(date)) {
    out.status = nwpprof::core::Status::InvalidInput;
    out.message = fmt::format("invalid date {:04d}-{:02d}-{:02d}", date.year, date.month, date.day);
    return out;
  }
  if (!is_valid_run(run_hour)) {
    out.status = nwpprof::core::Status::InvalidInput;
    out.message = fmt::format("run must be 0, 6, 12 or 18, got {}", run_hour);
    return out;
  }

  for (int hour = run_hour; hour <= kLastLeadHour; hour += nwpprof::core::constants::kLeadHourStepH) {
    auto path = directory / ecmwf_open_data_name(date, run_hour, hour);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
      out.missing.push_back(path);
    }
    out.files.push_back(std::move(path));
  }
  if (!out.missing.empty()) {
    out.status = nwpprof::core::Status::DataUnavailable;
    out.message = fmt::format("{} of {} forecast files missing, first: {}", out.missing.size(), out.files.size(),
                              out.missing.front().string());
  }
  return out;
}

}  // namespace nwpprof::io
