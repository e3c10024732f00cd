/**
 * @file test_netcdf_writer.cpp
 * @brief netCDF profile output tests.
 * @author Watosn
 */

#include <cmath>
#include <filesystem>
#include <string>
#include <vector>

#include <netcdf.h>
#include <spdlog/spdlog.h>

#include "nwpprof/io/netcdf_writer.hpp"

namespace {

nwpprof::profile::Profile make_profile(double hour) {
  nwpprof::profile::Profile p{};
  p.time_h = hour;
  p.surface.pressure_pa = 101000.0;
  p.pressure_pa = Eigen::ArrayXd(3);
  p.pressure_pa << 100000.0, 85000.0, 70000.0;
  p.temperature_k = Eigen::ArrayXd(3);
  p.temperature_k << 287.0, 280.0, nwpprof::profile::kNotAvailable;
  p.wind_u_mps = Eigen::ArrayXd::Constant(3, 4.0);
  p.wind_v_mps = Eigen::ArrayXd::Constant(3, -1.5);
  p.omega_pa_s = Eigen::ArrayXd::Constant(3, -0.1);
  p.specific_humidity = Eigen::ArrayXd::Constant(3, 0.005);
  p.height_m = Eigen::ArrayXd::Constant(3, 100.0);
  p.wwind_mps = Eigen::ArrayXd::Constant(3, 0.01);
  p.rh = Eigen::ArrayXd::Constant(3, 0.5);
  return p;
}

std::string text_attribute(int ncid, int varid, const char* name) {
  std::size_t len = 0;
  if (nc_inq_attlen(ncid, varid, name, &len) != NC_NOERR) {
    return {};
  }
  std::string out(len, '\0');
  if (nc_get_att_text(ncid, varid, name, out.data()) != NC_NOERR) {
    return {};
  }
  return out;
}

}  // namespace

int main() {
  namespace fs = std::filesystem;

  nwpprof::profile::SiteTimeSeries series{};
  series.lat_deg = 51.0;
  series.lon_deg = 6.0;
  series.horizontal_resolution_km = 28.0;
  series.profiles = {make_profile(0.0), make_profile(3.0)};

  const nwpprof::io::OutputContext context{.date = {.year = 2024, .month = 3, .day = 4},
                                           .site_id = "juelich",
                                           .site_name = "Jülich",
                                           .directory = fs::temp_directory_path() / "nwpprof_netcdf_out"};
  const nwpprof::io::NetcdfProfileWriter writer;
  const auto written = writer.write(series, context);
  if (written.status != nwpprof::core::Status::Ok || written.path.filename() != "20240304_juelich_ecmwf-open.nc") {
    spdlog::error("netcdf write failed: {}", written.message);
    return 1;
  }

  int ncid = -1;
  if (nc_open(written.path.c_str(), NC_NOWRITE, &ncid) != NC_NOERR) {
    spdlog::error("cannot reopen {}", written.path.string());
    return 2;
  }
  int rc = 0;
  int format = 0;
  int time_dim = -1;
  int level_dim = -1;
  std::size_t n_time = 0;
  std::size_t n_level = 0;
  nc_inq_format(ncid, &format);
  nc_inq_dimid(ncid, "time", &time_dim);
  nc_inq_dimid(ncid, "level", &level_dim);
  nc_inq_dimlen(ncid, time_dim, &n_time);
  nc_inq_dimlen(ncid, level_dim, &n_level);
  if (format != NC_FORMAT_NETCDF4_CLASSIC || n_time != 2 || n_level != 3) {
    spdlog::error("file layout wrong: format {} time {} level {}", format, n_time, n_level);
    rc = 3;
  }

  if (rc == 0 && (text_attribute(ncid, NC_GLOBAL, "Conventions") != "CF-1.8" ||
                  text_attribute(ncid, NC_GLOBAL, "title") != "Model data from Jülich" ||
                  text_attribute(ncid, NC_GLOBAL, "month") != "03")) {
    spdlog::error("global attributes wrong");
    rc = 4;
  }

  int time_var = -1;
  int temperature_var = -1;
  int lat_var = -1;
  nc_inq_varid(ncid, "time", &time_var);
  nc_inq_varid(ncid, "temperature", &temperature_var);
  nc_inq_varid(ncid, "latitude", &lat_var);
  if (rc == 0 && text_attribute(ncid, time_var, "units") != "hours since 2024-03-04 00:00:00 +00:00") {
    spdlog::error("time units wrong");
    rc = 5;
  }

  std::vector<float> times(2);
  std::vector<float> temperature(6);
  float lat = 0.0F;
  if (rc == 0 && (nc_get_var_float(ncid, time_var, times.data()) != NC_NOERR ||
                  nc_get_var_float(ncid, temperature_var, temperature.data()) != NC_NOERR ||
                  nc_get_var_float(ncid, lat_var, &lat) != NC_NOERR)) {
    spdlog::error("variables unreadable");
    rc = 6;
  }
  if (rc == 0 && (times[1] != 3.0F || temperature[0] != 287.0F || !std::isnan(temperature[2]) ||
                  temperature[4] != 280.0F || lat != 51.0F ||
                  text_attribute(ncid, temperature_var, "standard_name") != "air_temperature")) {
    spdlog::error("variable contents wrong");
    rc = 7;
  }
  nc_close(ncid);

  nwpprof::profile::SiteTimeSeries empty{};
  if (rc == 0 && writer.write(empty, context).status != nwpprof::core::Status::InvalidInput) {
    spdlog::error("empty series must be rejected");
    rc = 8;
  }

  fs::remove_all(context.directory);
  return rc;
}
