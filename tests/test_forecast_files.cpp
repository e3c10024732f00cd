/**
 * @file test_forecast_files.cpp
 * @brief ECMWF open-data file naming tests.
 * @author Watosn
 */

#include <filesystem>
#include <fstream>

#include <spdlog/spdlog.h>

#include "nwpprof/core/time.hpp"
#include "nwpprof/io/forecast_files.hpp"

int main() {
  namespace fs = std::filesystem;
  using nwpprof::core::Status;

  const nwpprof::core::CivilDate date{.year = 2024, .month = 3, .day = 4};
  if (nwpprof::io::ecmwf_open_data_name(date, 0, 0) != "20240304000000-0h-oper-fc.grib2" ||
      nwpprof::io::ecmwf_open_data_name(date, 18, 21) != "20240304180000-21h-scda-fc.grib2" ||
      nwpprof::io::ecmwf_stream(12) != "oper" || nwpprof::io::ecmwf_stream(6) != "scda") {
    spdlog::error("file naming wrong: {}", nwpprof::io::ecmwf_open_data_name(date, 0, 0));
    return 1;
  }

  const auto dir = fs::temp_directory_path() / "nwpprof_forecast_files_test";
  fs::remove_all(dir);
  fs::create_directories(dir);

  const auto none = nwpprof::io::ecmwf_open_data_files(date, 0, dir);
  if (none.status != Status::DataUnavailable || none.files.size() != 9 || none.missing.size() != 9) {
    spdlog::error("missing files not reported");
    return 2;
  }
  for (const auto& path : none.files) {
    std::ofstream(path) << "GRIB";
  }

  const auto run0 = nwpprof::io::ecmwf_open_data_files(date, 0, dir);
  if (run0.status != Status::Ok || run0.files.size() != 9 || !run0.missing.empty() ||
      run0.files.front().filename() != "20240304000000-0h-oper-fc.grib2" ||
      run0.files.back().filename() != "20240304000000-24h-oper-fc.grib2") {
    spdlog::error("run 0 files wrong: {}", run0.message);
    return 3;
  }

  fs::remove(run0.files[4]);
  const auto gap = nwpprof::io::ecmwf_open_data_files(date, 0, dir);
  if (gap.status != Status::DataUnavailable || gap.missing.size() != 1 || gap.missing.front() != run0.files[4] ||
      gap.files.size() != 9) {
    spdlog::error("single missing file not reported");
    return 4;
  }

  const auto run6 = nwpprof::io::ecmwf_open_data_files(date, 6, dir);
  if (run6.files.size() != 7 || run6.files.front().filename() != "20240304060000-6h-scda-fc.grib2" ||
      run6.files.back().filename() != "20240304060000-24h-scda-fc.grib2") {
    spdlog::error("run 6 files wrong");
    return 5;
  }

  if (nwpprof::io::ecmwf_open_data_files(date, 5, dir).status != Status::InvalidInput) {
    spdlog::error("invalid run must be rejected");
    return 6;
  }
  if (nwpprof::io::ecmwf_open_data_files({.year = 2023, .month = 2, .day = 29}, 0, dir).status !=
      Status::InvalidInput) {
    spdlog::error("invalid date must be rejected");
    return 7;
  }

  const auto parsed = nwpprof::core::parse_iso_date("2024-02-29");
  if (!parsed.has_value() || *parsed != nwpprof::core::CivilDate{.year = 2024, .month = 2, .day = 29} ||
      nwpprof::core::parse_iso_date("2023-02-29").has_value() || nwpprof::core::parse_iso_date("2024-1-05").has_value() ||
      nwpprof::core::parse_iso_date("2024-01-0x").has_value()) {
    spdlog::error("ISO date parsing wrong");
    return 8;
  }
  if (nwpprof::core::date_from_yyyymmdd(20240304L) != date) {
    spdlog::error("packed date conversion wrong");
    return 9;
  }

  fs::remove_all(dir);
  return 0;
}
