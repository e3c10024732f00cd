/**
 * @file main.cpp
 * @brief Per-site vertical profile extraction from ECMWF open-data forecasts.
 * @author Watosn
 */

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "nwpprof/adapters/grib_snapshot_source.hpp"
#include "nwpprof/core/time.hpp"
#include "nwpprof/io/delimited_writer.hpp"
#include "nwpprof/io/forecast_files.hpp"
#include "nwpprof/io/netcdf_writer.hpp"
#include "nwpprof/profile/profile_assembler.hpp"
#include "nwpprof/sites/site_registry.hpp"

namespace {

const char* status_to_string(nwpprof::core::Status s) {
  switch (s) {
    case nwpprof::core::Status::Ok:
      return "ok";
    case nwpprof::core::Status::InvalidInput:
      return "invalid_input";
    case nwpprof::core::Status::DataUnavailable:
      return "data_unavailable";
    case nwpprof::core::Status::IoError:
      return "io_error";
    case nwpprof::core::Status::UnsupportedGrid:
      return "unsupported_grid";
    case nwpprof::core::Status::GridMismatch:
      return "grid_mismatch";
    case nwpprof::core::Status::TimeMismatch:
      return "time_mismatch";
    case nwpprof::core::Status::UnitMismatch:
      return "unit_mismatch";
    case nwpprof::core::Status::PressureCoordinateDrift:
      return "pressure_coordinate_drift";
    default:
      return "unknown";
  }
}

std::unique_ptr<nwpprof::io::IProfileWriter> make_writer(const std::string& format) {
  if (format == "netcdf") {
    return std::make_unique<nwpprof::io::NetcdfProfileWriter>();
  }
  if (format == "csv") {
    return std::make_unique<nwpprof::io::DelimitedProfileWriter>(nwpprof::io::TextFormat::Csv);
  }
  if (format == "json") {
    return std::make_unique<nwpprof::io::DelimitedProfileWriter>(nwpprof::io::TextFormat::JsonLines);
  }
  return nullptr;
}

std::vector<std::string> short_names(const nwpprof::profile::VariableCatalog& catalog) {
  std::vector<std::string> out;
  for (const auto& v : catalog.variables()) {
    out.push_back(v.short_name);
  }
  return out;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 5 || argc > 7) {
    spdlog::error("usage: profile_cli <date:YYYY-MM-DD> <sites_csv> <grib_dir> <output_dir> [format:netcdf|csv|json] [site_ids]");
    spdlog::error("sites_csv row: id,name,latitude,longitude");
    spdlog::error("site_ids: comma-separated subset of sites_csv ids (default: all)");
    return 1;
  }

  const std::string date_text = argv[1];
  const std::filesystem::path sites_csv = argv[2];
  const std::filesystem::path grib_dir = argv[3];
  const std::filesystem::path output_dir = argv[4];
  const std::string format = (argc >= 6) ? argv[5] : "netcdf";
  const std::string site_ids = (argc >= 7) ? argv[6] : "";

  const auto date = nwpprof::core::parse_iso_date(date_text);
  if (!date.has_value()) {
    spdlog::error("invalid date: {}", date_text);
    return 4;
  }
  const auto writer = make_writer(format);
  if (!writer) {
    spdlog::error("format must be netcdf, csv or json");
    return 4;
  }

  const auto registry =
      nwpprof::sites::SiteRegistry::Create(nwpprof::sites::SiteRegistry::Config{.csv_file = sites_csv});
  if (registry->status() != nwpprof::core::Status::Ok) {
    spdlog::error("failed to load sites: {} ({})", sites_csv.string(), status_to_string(registry->status()));
    return 2;
  }
  if (registry->skipped_rows() > 0) {
    spdlog::warn("skipped {} site rows without usable coordinates", registry->skipped_rows());
  }

  const auto selection = registry->select(nwpprof::sites::split_ids(site_ids));
  if (!selection.unknown_ids.empty()) {
    spdlog::error("Invalid sites: {}", fmt::join(selection.unknown_ids, ","));
    return 1;
  }
  if (selection.sites.empty()) {
    spdlog::error("no sites to process");
    return 1;
  }

  const auto files = nwpprof::io::ecmwf_open_data_files(*date, 0, grib_dir);
  if (files.status != nwpprof::core::Status::Ok) {
    for (const auto& missing : files.missing) {
      spdlog::error("missing forecast file: {}", missing.string());
    }
    spdlog::error("{} ({})", files.message, status_to_string(files.status));
    return 3;
  }

  const nwpprof::profile::ProfileAssembler assembler{};
  const auto source = nwpprof::adapters::GribSnapshotSource::Create(nwpprof::adapters::GribSnapshotSource::Config{
      .files = files.files, .short_names = short_names(assembler.catalog())});
  const auto result = assembler.extract(*source, *date, nwpprof::sites::coordinates(selection.sites));
  if (result.status != nwpprof::core::Status::Ok) {
    spdlog::error("extraction failed: {} ({})", result.message, status_to_string(result.status));
    return 5;
  }

  int rc = 0;
  for (std::size_t i = 0; i < selection.sites.size(); ++i) {
    const auto& site = selection.sites[i];
    const nwpprof::io::OutputContext context{
        .date = *date, .site_id = site.id, .site_name = site.name, .directory = output_dir};
    const auto written = writer->write(result.series[i], context);
    if (written.status != nwpprof::core::Status::Ok) {
      spdlog::error("failed to write {}: {} ({})", site.id, written.message, status_to_string(written.status));
      rc = 6;
      continue;
    }
    spdlog::info("Saving {}", written.path.string());
  }
  return rc;
}
