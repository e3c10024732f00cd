/**
 * @file grib_snapshot_source.cpp
 * @brief ecCodes GRIB snapshot source implementation.
 * @author Watosn
 */

#include "nwpprof/adapters/grib_snapshot_source.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <eccodes.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "nwpprof/core/time.hpp"

namespace nwpprof::adapters {
namespace {

using nwpprof::core::GriddedField;
using nwpprof::core::Status;

struct FileCloser {
  void operator()(std::FILE* f) const { std::fclose(f); }
};
struct HandleDeleter {
  void operator()(codes_handle* h) const { codes_handle_delete(h); }
};
using FilePtr = std::unique_ptr<std::FILE, FileCloser>;
using HandlePtr = std::unique_ptr<codes_handle, HandleDeleter>;

/**
 * @brief Decode failure raised while reading one message.
 */
struct DecodeError {
  int code{CODES_SUCCESS};
  std::string key{};
};

bool get_string(codes_handle* h, const char* key, std::string& out, DecodeError& err) {
  std::size_t len = 0;
  int rc = codes_get_length(h, key, &len);
  if (rc == CODES_SUCCESS) {
    std::string buf(len + 1, '\0');
    rc = codes_get_string(h, key, buf.data(), &len);
    if (rc == CODES_SUCCESS) {
      out.assign(buf.c_str());
      return true;
    }
  }
  err = DecodeError{.code = rc, .key = key};
  return false;
}

bool get_long(codes_handle* h, const char* key, long& out, DecodeError& err) {
  const int rc = codes_get_long(h, key, &out);
  if (rc != CODES_SUCCESS) {
    err = DecodeError{.code = rc, .key = key};
    return false;
  }
  return true;
}

bool get_double(codes_handle* h, const char* key, double& out, DecodeError& err) {
  const int rc = codes_get_double(h, key, &out);
  if (rc != CODES_SUCCESS) {
    err = DecodeError{.code = rc, .key = key};
    return false;
  }
  return true;
}

bool get_doubles(codes_handle* h, const char* key, std::vector<double>& out, DecodeError& err) {
  std::size_t n = 0;
  int rc = codes_get_size(h, key, &n);
  if (rc == CODES_SUCCESS) {
    out.resize(n);
    rc = codes_get_double_array(h, key, out.data(), &n);
    if (rc == CODES_SUCCESS) {
      out.resize(n);
      return true;
    }
  }
  err = DecodeError{.code = rc, .key = key};
  return false;
}

bool get_longs(codes_handle* h, const char* key, std::vector<long>& out, DecodeError& err) {
  std::size_t n = 0;
  int rc = codes_get_size(h, key, &n);
  if (rc == CODES_SUCCESS) {
    out.resize(n);
    rc = codes_get_long_array(h, key, out.data(), &n);
    if (rc == CODES_SUCCESS) {
      out.resize(n);
      return true;
    }
  }
  err = DecodeError{.code = rc, .key = key};
  return false;
}

long long_or(codes_handle* h, const char* key, long fallback) {
  long v = fallback;
  if (codes_is_defined(h, key) != 0 && codes_get_long(h, key, &v) == CODES_SUCCESS) {
    return v;
  }
  return fallback;
}

bool is_regular(const std::string& grid_type) { return grid_type == "regular_ll" || grid_type == "regular_gg"; }
bool is_reduced(const std::string& grid_type) { return grid_type == "reduced_ll" || grid_type == "reduced_gg"; }

/**
 * @brief Scanning-mode flags of a grid message.
 */
struct Scanning {
  bool i_negative{};
  bool j_positive{};
  bool j_consecutive{};
};

Scanning read_scanning(codes_handle* h) {
  return Scanning{.i_negative = long_or(h, "iScansNegatively", 0) != 0,
                  .j_positive = long_or(h, "jScansPositively", 0) != 0,
                  .j_consecutive = long_or(h, "jPointsAreConsecutive", 0) != 0};
}

void mask_missing(codes_handle* h, std::vector<double>& values) {
  if (long_or(h, "bitmapPresent", 0) == 0) {
    return;
  }
  double missing = 9999.0;
  if (codes_get_double(h, "missingValue", &missing) != CODES_SUCCESS) {
    return;
  }
  for (auto& v : values) {
    if (v == missing) {
      v = std::numeric_limits<double>::quiet_NaN();
    }
  }
}

// Indices that visit `keys` in ascending order.
std::vector<long> ascending_order(const std::vector<double>& keys) {
  std::vector<long> order(keys.size());
  for (std::size_t i = 0; i < order.size(); ++i) {
    order[i] = static_cast<long>(i);
  }
  std::stable_sort(order.begin(), order.end(), [&keys](long a, long b) {
    return keys[static_cast<std::size_t>(a)] < keys[static_cast<std::size_t>(b)];
  });
  return order;
}

// Row and column order come from the per-point coordinates, so the matrix follows whatever the scanning flags say.
bool decode_regular(codes_handle* h, GriddedField& field, const std::vector<double>& values, std::string& problem,
                    DecodeError& err) {
  long ni = 0;
  long nj = 0;
  std::vector<double> lats;
  std::vector<double> lons;
  if (!get_long(h, "Ni", ni, err) || !get_long(h, "Nj", nj, err) || !get_doubles(h, "latitudes", lats, err) ||
      !get_doubles(h, "longitudes", lons, err)) {
    return false;
  }
  if (ni <= 0 || nj <= 0 || static_cast<long>(values.size()) != ni * nj ||
      lats.size() != values.size() || lons.size() != values.size()) {
    problem = fmt::format("{} values on a {}x{} grid with {} point coordinates", values.size(), nj, ni, lats.size());
    return false;
  }
  double dlon = 0.0;
  if (codes_is_defined(h, "iDirectionIncrementInDegrees") != 0 && !get_double(h, "iDirectionIncrementInDegrees", dlon, err)) {
    return false;
  }
  field.lon_increment_deg = dlon;

  const Scanning scan = read_scanning(h);
  const auto at = [&](long r, long c) {
    return static_cast<std::size_t>(scan.j_consecutive ? c * nj + r : r * ni + c);
  };
  std::vector<double> row_lat(static_cast<std::size_t>(nj));
  std::vector<double> col_lon(static_cast<std::size_t>(ni));
  for (long r = 0; r < nj; ++r) {
    row_lat[static_cast<std::size_t>(r)] = lats[at(r, 0)];
  }
  for (long c = 0; c < ni; ++c) {
    col_lon[static_cast<std::size_t>(c)] = lons[at(0, c)];
  }
  const auto rows = ascending_order(row_lat);
  const auto cols = ascending_order(col_lon);

  field.latitudes_deg.resize(rows.size());
  field.longitudes_deg.resize(cols.size());
  field.values.resize(nj, ni);
  for (long i = 0; i < nj; ++i) {
    const long r = rows[static_cast<std::size_t>(i)];
    field.latitudes_deg[static_cast<std::size_t>(i)] = row_lat[static_cast<std::size_t>(r)];
    for (long j = 0; j < ni; ++j) {
      const long c = cols[static_cast<std::size_t>(j)];
      field.values(i, j) = values[at(r, c)];
    }
  }
  for (long j = 0; j < ni; ++j) {
    field.longitudes_deg[static_cast<std::size_t>(j)] = col_lon[static_cast<std::size_t>(cols[static_cast<std::size_t>(j)])];
  }
  return true;
}

bool decode_reduced(codes_handle* h, GriddedField& field, const std::vector<double>& values, std::string& problem,
                    DecodeError& err) {
  std::vector<long> pl;
  std::vector<double> lats;
  std::vector<double> lons;
  if (!get_longs(h, "pl", pl, err) || !get_doubles(h, "latitudes", lats, err) ||
      !get_doubles(h, "longitudes", lons, err)) {
    return false;
  }
  const long nj = static_cast<long>(pl.size());
  long total = 0;
  long n_max = 0;
  for (const long n : pl) {
    total += n;
    n_max = std::max(n_max, n);
  }
  if (total != static_cast<long>(values.size()) || lats.size() != values.size() || lons.size() != values.size() ||
      n_max <= 0) {
    problem = fmt::format("{} values on a reduced grid with {} rows totalling {} points", values.size(), nj, total);
    return false;
  }

  const double dlon = 360.0 / static_cast<double>(n_max);
  field.lon_increment_deg = dlon;
  field.longitudes_deg.resize(static_cast<std::size_t>(n_max));
  for (long c = 0; c < n_max; ++c) {
    field.longitudes_deg[static_cast<std::size_t>(c)] = static_cast<double>(c) * dlon;
  }

  // Empty rows have no latitude of their own and are dropped.
  std::vector<long> offsets;
  std::vector<long> counts;
  std::vector<double> row_lat;
  long offset = 0;
  for (const long n : pl) {
    if (n > 0) {
      offsets.push_back(offset);
      counts.push_back(n);
      row_lat.push_back(lats[static_cast<std::size_t>(offset)]);
    }
    offset += n;
  }
  const auto rows = ascending_order(row_lat);

  const Scanning scan = read_scanning(h);
  field.latitudes_deg.resize(rows.size());
  field.values.resize(static_cast<Eigen::Index>(rows.size()), n_max);
  for (std::size_t i = 0; i < rows.size(); ++i) {
    const auto r = static_cast<std::size_t>(rows[i]);
    const long start = offsets[r];
    const long n = counts[r];
    const double first_lon = lons[static_cast<std::size_t>(start)];
    field.latitudes_deg[i] = row_lat[r];
    for (long c = 0; c < n_max; ++c) {
      const double east = field.longitudes_deg[static_cast<std::size_t>(c)] - first_lon;
      const double steps = (scan.i_negative ? -east : east) * static_cast<double>(n) / 360.0;
      const long src = ((std::lround(steps) % n) + n) % n;
      field.values(static_cast<Eigen::Index>(i), c) = values[static_cast<std::size_t>(start + src)];
    }
  }
  return true;
}

}  // namespace

class GribSnapshotSource::Impl {
 public:
  explicit Impl(std::vector<std::string> short_names)
      : context_(codes_context_get_default()), short_names_(std::move(short_names)) {}

  // One message is decoded at a time and released before the next is read.
  [[nodiscard]] nwpprof::core::SnapshotLoad decode_file(const std::filesystem::path& path,
                                                        const nwpprof::core::FieldVisitor& visit) const {
    nwpprof::core::SnapshotLoad out{};
    FilePtr file(std::fopen(path.c_str(), "rb"));
    if (!file) {
      out.status = Status::IoError;
      out.message = fmt::format("failed to open {}", path.string());
      return out;
    }

    std::size_t index = 0;
    for (;;) {
      int rc = CODES_SUCCESS;
      HandlePtr handle(codes_handle_new_from_file(context_, file.get(), PRODUCT_GRIB, &rc));
      if (!handle) {
        if (rc != CODES_SUCCESS) {
          out.status = Status::IoError;
          out.message = fmt::format("{}: message {}: {}", path.string(), index, codes_get_error_message(rc));
        }
        break;
      }
      ++index;

      GriddedField field{};
      std::string problem;
      DecodeError err{};
      if (!decode_message(handle.get(), field, problem, err)) {
        if (err.code != CODES_SUCCESS) {
          out.status = Status::IoError;
          out.message =
              fmt::format("{}: message {}: key {}: {}", path.string(), index, err.key, codes_get_error_message(err.code));
        } else {
          out.status = Status::InvalidInput;
          out.message = fmt::format("{}: message {}: {}", path.string(), index, problem);
        }
        return out;
      }
      if (!field.short_name.empty() && !visit(field)) {
        break;
      }
    }
    return out;
  }

 private:
  [[nodiscard]] bool wanted(const std::string& short_name) const {
    return short_names_.empty() || std::find(short_names_.begin(), short_names_.end(), short_name) != short_names_.end();
  }

  // Leaves `field.short_name` empty for skipped messages.
  [[nodiscard]] bool decode_message(codes_handle* h, GriddedField& field, std::string& problem, DecodeError& err) const {
    std::string short_name;
    if (!get_string(h, "shortName", short_name, err)) {
      return false;
    }
    if (!wanted(short_name)) {
      spdlog::debug("skipping GRIB message {}", short_name);
      return true;
    }

    std::string type_of_level;
    long data_date = 0;
    long forecast_time = 0;
    if (!get_string(h, "typeOfLevel", type_of_level, err) || !get_double(h, "level", field.level, err) ||
        !get_string(h, "units", field.units, err) || !get_string(h, "gridType", field.grid_type, err) ||
        !get_long(h, "dataDate", data_date, err) || !get_long(h, "forecastTime", forecast_time, err)) {
      return false;
    }
    field.level_type = nwpprof::core::level_type_from_name(type_of_level);
    field.level_units = type_of_level == "isobaricInPa" ? "Pa" : "hPa";
    if (field.level_type == nwpprof::core::LevelType::Isobaric && codes_is_defined(h, "pressureUnits") != 0 &&
        !get_string(h, "pressureUnits", field.level_units, err)) {
      return false;
    }
    field.date = nwpprof::core::date_from_yyyymmdd(data_date);
    field.forecast_hour = static_cast<int>(forecast_time);

    // Unsupported grids keep empty coordinates so the locator reports them.
    if (is_regular(field.grid_type) || is_reduced(field.grid_type)) {
      std::vector<double> values;
      if (!get_doubles(h, "values", values, err)) {
        return false;
      }
      mask_missing(h, values);
      const bool ok = is_regular(field.grid_type) ? decode_regular(h, field, values, problem, err)
                                                  : decode_reduced(h, field, values, problem, err);
      if (!ok) {
        return false;
      }
    }
    field.short_name = std::move(short_name);
    return true;
  }

  codes_context* context_{};
  std::vector<std::string> short_names_{};
};

std::unique_ptr<GribSnapshotSource> GribSnapshotSource::Create(const Config& config) {
  auto ptr = std::unique_ptr<GribSnapshotSource>(new GribSnapshotSource(config));
  ptr->impl_ = std::make_shared<Impl>(config.short_names);
  return ptr;
}

nwpprof::core::SnapshotLoad GribSnapshotSource::for_each_field(std::size_t index,
                                                               const nwpprof::core::FieldVisitor& visit) const {
  if (index >= config_.files.size()) {
    return nwpprof::core::SnapshotLoad{
        .status = Status::InvalidInput,
        .message = fmt::format("snapshot {} out of range ({} files)", index, config_.files.size())};
  }
  const auto& path = config_.files[index];
  spdlog::info("Opening {}", path.string());
  return impl_->decode_file(path, visit);
}

}  // namespace nwpprof::adapters
