/**
 * @file netcdf_writer.cpp
 * @brief netCDF-C backed profile writer.
 * @author Watosn
 */

#include "nwpprof/io/netcdf_writer.hpp"

#include <algorithm>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <netcdf.h>

#include "nwpprof/io/attribute_catalog.hpp"

namespace nwpprof::io {
namespace {

class NcFile final {
 public:
  NcFile() = default;
  NcFile(const NcFile&) = delete;
  NcFile& operator=(const NcFile&) = delete;
  ~NcFile() {
    if (ncid_ >= 0) {
      nc_close(ncid_);
    }
  }

  int create(const std::filesystem::path& path) {
    return nc_create(path.c_str(), NC_CLOBBER | NC_NETCDF4 | NC_CLASSIC_MODEL, &ncid_);
  }

  int close() {
    const int rc = nc_close(ncid_);
    ncid_ = -1;
    return rc;
  }

  [[nodiscard]] int id() const noexcept { return ncid_; }

 private:
  int ncid_{-1};
};

std::string nc_error(int rc, const std::string& what) { return fmt::format("{}: {}", what, nc_strerror(rc)); }

int put_text(int ncid, int varid, const char* name, const std::string& value) {
  return nc_put_att_text(ncid, varid, name, value.size(), value.c_str());
}

std::vector<float> surface_values(const nwpprof::profile::SiteTimeSeries& series, const std::string& name) {
  std::vector<float> out;
  out.reserve(series.profiles.size());
  for (const auto& profile : series.profiles) {
    out.push_back(static_cast<float>(
        nwpprof::profile::surface_variable(profile, name).value_or(nwpprof::profile::kNotAvailable)));
  }
  return out;
}

std::vector<float> level_values(const nwpprof::profile::SiteTimeSeries& series, const std::string& name,
                                Eigen::Index n_level) {
  std::vector<float> out(series.profiles.size() * static_cast<std::size_t>(n_level),
                         static_cast<float>(nwpprof::profile::kNotAvailable));
  for (std::size_t t = 0; t < series.profiles.size(); ++t) {
    const auto* values = nwpprof::profile::level_variable(series.profiles[t], name);
    if (values == nullptr) {
      continue;
    }
    const Eigen::Index n = std::min(n_level, values->size());
    for (Eigen::Index k = 0; k < n; ++k) {
      out[t * static_cast<std::size_t>(n_level) + static_cast<std::size_t>(k)] = static_cast<float>((*values)(k));
    }
  }
  return out;
}

float scalar_value(const nwpprof::profile::SiteTimeSeries& series, const std::string& name) {
  if (name == "latitude") {
    return static_cast<float>(series.lat_deg);
  }
  if (name == "longitude") {
    return static_cast<float>(series.lon_deg);
  }
  if (name == "horizontal_resolution") {
    return static_cast<float>(series.horizontal_resolution_km);
  }
  return static_cast<float>(nwpprof::profile::kNotAvailable);
}

}  // namespace

WriteResult NetcdfProfileWriter::write(const nwpprof::profile::SiteTimeSeries& series,
                                       const OutputContext& context) const {
  using nwpprof::core::Status;
  WriteResult result{};
  if (context.site_id.empty()) {
    result.status = Status::InvalidInput;
    result.message = "site id is empty";
    return result;
  }
  if (series.profiles.empty()) {
    result.status = Status::InvalidInput;
    result.message = fmt::format("no profiles to write for {}", context.site_id);
    return result;
  }
  const Eigen::Index n_level = series.profiles.front().pressure_pa.size();
  if (n_level == 0) {
    result.status = Status::InvalidInput;
    result.message = fmt::format("no pressure levels to write for {}", context.site_id);
    return result;
  }
  result.path = context.directory / (output_stem(context) + ".nc");

  std::error_code ec;
  if (!context.directory.empty()) {
    std::filesystem::create_directories(context.directory, ec);
    if (ec) {
      result.status = Status::IoError;
      result.message = fmt::format("failed to create {}: {}", context.directory.string(), ec.message());
      return result;
    }
  }

  const auto fail = [&result](int rc, const std::string& what) {
    result.status = Status::IoError;
    result.message = nc_error(rc, what);
    return result;
  };

  NcFile file;
  int rc = file.create(result.path);
  if (rc != NC_NOERR) {
    return fail(rc, fmt::format("nc_create {}", result.path.string()));
  }
  const int ncid = file.id();

  const std::vector<std::pair<const char*, std::string>> globals{
      {"Conventions", "CF-1.8"},
      {"title", "Model data from " + context.site_name},
      {"location", context.site_name},
      {"cloudnet_file_type", "model"},
      {"year", fmt::format("{:04d}", context.date.year)},
      {"month", fmt::format("{:02d}", context.date.month)},
      {"day", fmt::format("{:02d}", context.date.day)},
      {"source", context.source},
      {"nwpprof_version", producer_version()},
  };
  for (const auto& [name, value] : globals) {
    if ((rc = put_text(ncid, NC_GLOBAL, name, value)) != NC_NOERR) {
      return fail(rc, fmt::format("global attribute {}", name));
    }
  }

  int time_dim = -1;
  int level_dim = -1;
  if ((rc = nc_def_dim(ncid, "time", series.profiles.size(), &time_dim)) != NC_NOERR) {
    return fail(rc, "nc_def_dim time");
  }
  if ((rc = nc_def_dim(ncid, "level", static_cast<std::size_t>(n_level), &level_dim)) != NC_NOERR) {
    return fail(rc, "nc_def_dim level");
  }

  int time_var = -1;
  if ((rc = nc_def_var(ncid, "time", NC_FLOAT, 1, &time_dim, &time_var)) != NC_NOERR) {
    return fail(rc, "nc_def_var time");
  }
  const std::vector<std::pair<const char*, std::string>> time_attrs{
      {"long_name", "Hours UTC"}, {"units", time_units(context.date)}, {"standard_name", "time"},
      {"axis", "T"},              {"calendar", "standard"},
  };
  for (const auto& [name, value] : time_attrs) {
    if ((rc = put_text(ncid, time_var, name, value)) != NC_NOERR) {
      return fail(rc, fmt::format("time attribute {}", name));
    }
  }

  const auto& attributes = profile_attributes();
  std::vector<int> varids(attributes.size(), -1);
  for (std::size_t i = 0; i < attributes.size(); ++i) {
    const auto& attr = attributes[i];
    const int dimids[2] = {time_dim, level_dim};
    int ndims = 0;
    if (attr.dimensions == Dimensions::Time) {
      ndims = 1;
    } else if (attr.dimensions == Dimensions::TimeLevel) {
      ndims = 2;
    }
    if ((rc = nc_def_var(ncid, attr.name.c_str(), NC_FLOAT, ndims, ndims > 0 ? dimids : nullptr, &varids[i])) !=
        NC_NOERR) {
      return fail(rc, fmt::format("nc_def_var {}", attr.name));
    }
    if ((rc = put_text(ncid, varids[i], "units", attr.units)) != NC_NOERR ||
        (rc = put_text(ncid, varids[i], "long_name", attr.long_name)) != NC_NOERR) {
      return fail(rc, fmt::format("attributes of {}", attr.name));
    }
    if (!attr.standard_name.empty() && (rc = put_text(ncid, varids[i], "standard_name", attr.standard_name)) != NC_NOERR) {
      return fail(rc, fmt::format("standard_name of {}", attr.name));
    }
    if (!attr.comment.empty() && (rc = put_text(ncid, varids[i], "comment", attr.comment)) != NC_NOERR) {
      return fail(rc, fmt::format("comment of {}", attr.name));
    }
  }
  if ((rc = nc_enddef(ncid)) != NC_NOERR) {
    return fail(rc, "nc_enddef");
  }

  std::vector<float> times;
  times.reserve(series.profiles.size());
  for (const auto& profile : series.profiles) {
    times.push_back(static_cast<float>(profile.time_h));
  }
  if ((rc = nc_put_var_float(ncid, time_var, times.data())) != NC_NOERR) {
    return fail(rc, "write time");
  }

  for (std::size_t i = 0; i < attributes.size(); ++i) {
    const auto& attr = attributes[i];
    if (attr.dimensions == Dimensions::Scalar) {
      const float value = scalar_value(series, attr.name);
      rc = nc_put_var_float(ncid, varids[i], &value);
    } else if (attr.dimensions == Dimensions::Time) {
      const auto values = surface_values(series, attr.name);
      rc = nc_put_var_float(ncid, varids[i], values.data());
    } else {
      const auto values = level_values(series, attr.name, n_level);
      rc = nc_put_var_float(ncid, varids[i], values.data());
    }
    if (rc != NC_NOERR) {
      return fail(rc, fmt::format("write {}", attr.name));
    }
  }

  if ((rc = file.close()) != NC_NOERR) {
    return fail(rc, fmt::format("nc_close {}", result.path.string()));
  }
  return result;
}

}  // namespace nwpprof::io
