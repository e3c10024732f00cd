/**
 * @file test_delimited_writer.cpp
 * @brief CSV and JSON-lines profile output tests.
 * @author Watosn
 */

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "nwpprof/io/attribute_catalog.hpp"
#include "nwpprof/io/delimited_writer.hpp"

namespace {

using nwpprof::profile::kNotAvailable;

std::vector<std::string> lines_of(const std::string& text) {
  std::vector<std::string> out;
  std::stringstream ss(text);
  std::string line;
  while (std::getline(ss, line)) {
    out.push_back(line);
  }
  return out;
}

nwpprof::profile::Profile make_profile(double hour, double top_temperature) {
  nwpprof::profile::Profile p{};
  p.time_h = hour;
  p.surface.pressure_pa = 101000.0;
  p.surface.temp_2m_k = 288.5;
  p.pressure_pa = Eigen::ArrayXd(2);
  p.pressure_pa << 100000.0, 85000.0;
  p.temperature_k = Eigen::ArrayXd(2);
  p.temperature_k << 287.0, top_temperature;
  p.wind_u_mps = Eigen::ArrayXd::Constant(2, 4.0);
  p.wind_v_mps = Eigen::ArrayXd::Constant(2, -1.5);
  p.omega_pa_s = Eigen::ArrayXd::Constant(2, -0.1);
  p.specific_humidity = Eigen::ArrayXd::Constant(2, 0.005);
  p.height_m = Eigen::ArrayXd(2);
  p.height_m << 110.0, 1490.0;
  p.wwind_mps = Eigen::ArrayXd::Constant(2, 0.01);
  p.rh = Eigen::ArrayXd::Constant(2, 0.5);
  return p;
}

nwpprof::profile::SiteTimeSeries make_series() {
  nwpprof::profile::SiteTimeSeries s{};
  s.lat_deg = 61.75;
  s.lon_deg = 24.25;
  s.horizontal_resolution_km = 28.0;
  s.profiles.push_back(make_profile(0.0, 280.0));
  s.profiles.push_back(make_profile(3.0, kNotAvailable));
  return s;
}

const nwpprof::io::OutputContext kContext{.date = {.year = 2024, .month = 3, .day = 4},
                                          .site_id = "hyytiala",
                                          .site_name = "Hyytiälä",
                                          .directory = std::filesystem::temp_directory_path() / "nwpprof_text_out"};

}  // namespace

int main() {
  using nwpprof::io::DelimitedProfileWriter;
  using nwpprof::io::TextFormat;

  if (nwpprof::io::output_stem(kContext) != "20240304_hyytiala_ecmwf-open" ||
      nwpprof::io::time_units(kContext.date) != "hours since 2024-03-04 00:00:00 +00:00") {
    spdlog::error("output naming wrong: {}", nwpprof::io::output_stem(kContext));
    return 1;
  }

  const auto series = make_series();

  const DelimitedProfileWriter csv(TextFormat::Csv);
  std::ostringstream csv_out;
  csv.write_to(csv_out, series, kContext);
  const auto csv_lines = lines_of(csv_out.str());
  if (csv_lines.size() != 6 || csv_lines[0].rfind("#record_type=metadata,schema=nwpprof_profile_v1", 0) != 0 ||
      csv_lines[0].find("latitude=61.75") == std::string::npos) {
    spdlog::error("csv metadata wrong: {} lines", csv_lines.size());
    return 2;
  }
  if (csv_lines[1] !=
      "time,level,sfc_pressure,sfc_pressure_amsl,sfc_temp_2m,sfc_dewpoint_temp_2m,sfc_wind_u_10m,sfc_wind_v_10m,"
      "soil_temperature,pressure,temperature,uwind,vwind,wwind,omega,rh,q,height") {
    spdlog::error("csv header wrong: {}", csv_lines[1]);
    return 3;
  }
  if (csv_lines[2] != "0,0,101000,,288.5,,,,,100000,287,4,-1.5,0.01,-0.1,0.5,0.005,110") {
    spdlog::error("csv row wrong: {}", csv_lines[2]);
    return 4;
  }
  if (csv_lines[5] != "3,1,101000,,288.5,,,,,85000,,4,-1.5,0.01,-0.1,0.5,0.005,1490") {
    spdlog::error("missing value not written as empty cell: {}", csv_lines[5]);
    return 5;
  }

  const DelimitedProfileWriter json(TextFormat::JsonLines);
  std::ostringstream json_out;
  json.write_to(json_out, series, kContext);
  const auto json_lines = lines_of(json_out.str());
  if (json_lines.size() != 3 || json_lines[0].find("\"title\":\"Model data from Hyytiälä\"") == std::string::npos ||
      json_lines[0].find("\"Conventions\":\"CF-1.8\"") == std::string::npos) {
    spdlog::error("json metadata wrong");
    return 6;
  }
  if (json_lines[2].find("\"time\":3,") == std::string::npos ||
      json_lines[2].find("\"temperature\":[287,null]") == std::string::npos ||
      json_lines[2].find("\"sfc_pressure_amsl\":null") == std::string::npos) {
    spdlog::error("json profile record wrong: {}", json_lines[2]);
    return 7;
  }

  const auto written = csv.write(series, kContext);
  if (written.status != nwpprof::core::Status::Ok ||
      written.path.filename() != "20240304_hyytiala_ecmwf-open.csv" || !std::filesystem::exists(written.path)) {
    spdlog::error("csv file not written: {}", written.message);
    return 8;
  }
  std::ifstream in(written.path);
  std::stringstream file_text;
  file_text << in.rdbuf();
  if (file_text.str() != csv_out.str()) {
    spdlog::error("file contents differ from stream output");
    return 9;
  }
  if (json.write(series, kContext).path.extension() != ".jsonl") {
    spdlog::error("json extension wrong");
    return 10;
  }

  auto anonymous = kContext;
  anonymous.site_id.clear();
  if (csv.write(series, anonymous).status != nwpprof::core::Status::InvalidInput) {
    spdlog::error("empty site id must be rejected");
    return 11;
  }

  auto punctuated = kContext;
  punctuated.site_name = "Hyytiälä, \"SMEAR II\"";
  punctuated.source = "ECMWF open data\nrun=00";
  std::ostringstream punctuated_out;
  csv.write_to(punctuated_out, series, punctuated);
  const auto punctuated_lines = lines_of(punctuated_out.str());
  if (punctuated_lines.size() != 6 ||
      punctuated_lines[0].find(",location=\"Hyytiälä, \"\"SMEAR II\"\"\",source=\"ECMWF open data run=00\",version=") ==
          std::string::npos) {
    spdlog::error("csv metadata values not quoted: {}", punctuated_lines.empty() ? "" : punctuated_lines[0]);
    return 14;
  }

  std::size_t n_time = 0;
  std::size_t n_level = 0;
  for (const auto& attr : nwpprof::io::profile_attributes()) {
    n_time += attr.dimensions == nwpprof::io::Dimensions::Time ? 1U : 0U;
    n_level += attr.dimensions == nwpprof::io::Dimensions::TimeLevel ? 1U : 0U;
    if (attr.units.empty() || attr.long_name.empty()) {
      spdlog::error("attribute entry {} incomplete", attr.name);
      return 12;
    }
  }
  if (n_time != 7 || n_level != 9) {
    spdlog::error("attribute catalogue shape wrong: {} time, {} level", n_time, n_level);
    return 13;
  }

  std::filesystem::remove_all(kContext.directory);
  return 0;
}
