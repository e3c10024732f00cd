/**
 * @file delimited_writer.cpp
 * @brief CSV and JSON-lines profile writer.
 * @author Watosn
 */

#include "nwpprof/io/delimited_writer.hpp"

#include <cmath>
#include <fstream>
#include <ostream>
#include <system_error>
#include <vector>

#include <fmt/format.h>

#include "nwpprof/io/attribute_catalog.hpp"

namespace nwpprof::io {
namespace {

constexpr const char* kSchema = "nwpprof_profile_v1";

std::string json_escape(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
        } else {
          out += c;
        }
    }
  }
  return out;
}

// Metadata values holding separators are double-quoted with `""` for a quote; line breaks become spaces.
std::string metadata_value(const std::string& text) {
  std::string out;
  out.reserve(text.size() + 2);
  bool needs_quotes = false;
  for (const char c : text) {
    if (c == '\n' || c == '\r') {
      out += ' ';
      continue;
    }
    if (c == '"') {
      out += "\"\"";
      needs_quotes = true;
      continue;
    }
    needs_quotes = needs_quotes || c == ',' || c == '=';
    out += c;
  }
  return needs_quotes ? "\"" + out + "\"" : out;
}

std::string csv_number(double value) {
  if (!std::isfinite(value)) {
    return {};
  }
  return fmt::format("{:.9g}", value);
}

std::string json_number(double value) {
  if (!std::isfinite(value)) {
    return "null";
  }
  return fmt::format("{:.9g}", value);
}

std::vector<const VariableAttributes*> select_attributes(Dimensions dims) {
  std::vector<const VariableAttributes*> out;
  for (const auto& attr : profile_attributes()) {
    if (attr.dimensions == dims) {
      out.push_back(&attr);
    }
  }
  return out;
}

double level_value(const nwpprof::profile::Profile& profile, const std::string& name, Eigen::Index k) {
  const auto* values = nwpprof::profile::level_variable(profile, name);
  if (values == nullptr || k >= values->size()) {
    return nwpprof::profile::kNotAvailable;
  }
  return (*values)(k);
}

void write_csv(std::ostream& out, const nwpprof::profile::SiteTimeSeries& series, const OutputContext& context) {
  const auto surface = select_attributes(Dimensions::Time);
  const auto levels = select_attributes(Dimensions::TimeLevel);

  out << "#record_type=metadata,schema=" << kSchema << ",project=nwpprof,site=" << metadata_value(context.site_id)
      << ",location=" << metadata_value(context.site_name) << ",source=" << metadata_value(context.source)
      << ",version=" << producer_version()
      << ",time_units=" << time_units(context.date) << ",latitude=" << csv_number(series.lat_deg)
      << ",longitude=" << csv_number(series.lon_deg)
      << ",horizontal_resolution=" << csv_number(series.horizontal_resolution_km) << "\n";

  out << "time,level";
  for (const auto* attr : surface) {
    out << "," << attr->name;
  }
  for (const auto* attr : levels) {
    out << "," << attr->name;
  }
  out << "\n";

  for (const auto& profile : series.profiles) {
    std::string surface_cells;
    for (const auto* attr : surface) {
      surface_cells += ",";
      surface_cells += csv_number(nwpprof::profile::surface_variable(profile, attr->name)
                                      .value_or(nwpprof::profile::kNotAvailable));
    }
    const Eigen::Index n_level = profile.pressure_pa.size();
    if (n_level == 0) {
      out << csv_number(profile.time_h) << "," << surface_cells << std::string(levels.size(), ',') << "\n";
      continue;
    }
    for (Eigen::Index k = 0; k < n_level; ++k) {
      out << csv_number(profile.time_h) << "," << k << surface_cells;
      for (const auto* attr : levels) {
        out << "," << csv_number(level_value(profile, attr->name, k));
      }
      out << "\n";
    }
  }
}

void write_json(std::ostream& out, const nwpprof::profile::SiteTimeSeries& series, const OutputContext& context) {
  const auto surface = select_attributes(Dimensions::Time);
  const auto levels = select_attributes(Dimensions::TimeLevel);

  out << "{\"record_type\":\"metadata\",\"schema\":\"" << kSchema << "\",\"project\":\"nwpprof\""
      << ",\"Conventions\":\"CF-1.8\",\"title\":\"" << json_escape("Model data from " + context.site_name)
      << "\",\"location\":\"" << json_escape(context.site_name) << "\",\"site\":\"" << json_escape(context.site_id)
      << "\",\"cloudnet_file_type\":\"model\",\"year\":\"" << fmt::format("{:04d}", context.date.year)
      << "\",\"month\":\"" << fmt::format("{:02d}", context.date.month) << "\",\"day\":\""
      << fmt::format("{:02d}", context.date.day) << "\",\"source\":\"" << json_escape(context.source)
      << "\",\"version\":\"" << producer_version() << "\",\"time_units\":\"" << time_units(context.date)
      << "\",\"latitude\":" << json_number(series.lat_deg) << ",\"longitude\":" << json_number(series.lon_deg)
      << ",\"horizontal_resolution\":" << json_number(series.horizontal_resolution_km) << "}\n";

  for (const auto& profile : series.profiles) {
    out << "{\"record_type\":\"profile\",\"schema\":\"" << kSchema << "\",\"time\":" << json_number(profile.time_h);
    for (const auto* attr : surface) {
      out << ",\"" << attr->name << "\":"
          << json_number(nwpprof::profile::surface_variable(profile, attr->name)
                             .value_or(nwpprof::profile::kNotAvailable));
    }
    const Eigen::Index n_level = profile.pressure_pa.size();
    for (const auto* attr : levels) {
      out << ",\"" << attr->name << "\":[";
      for (Eigen::Index k = 0; k < n_level; ++k) {
        if (k > 0) {
          out << ",";
        }
        out << json_number(level_value(profile, attr->name, k));
      }
      out << "]";
    }
    out << "}\n";
  }
}

}  // namespace

std::string DelimitedProfileWriter::extension() const {
  return format_ == TextFormat::Csv ? ".csv" : ".jsonl";
}

void DelimitedProfileWriter::write_to(std::ostream& out, const nwpprof::profile::SiteTimeSeries& series,
                                      const OutputContext& context) const {
  if (format_ == TextFormat::Csv) {
    write_csv(out, series, context);
  } else {
    write_json(out, series, context);
  }
}

WriteResult DelimitedProfileWriter::write(const nwpprof::profile::SiteTimeSeries& series,
                                          const OutputContext& context) const {
  WriteResult result{};
  if (context.site_id.empty()) {
    result.status = nwpprof::core::Status::InvalidInput;
    result.message = "site id is empty";
    return result;
  }
  result.path = context.directory / (output_stem(context) + extension());

  std::error_code ec;
  if (!context.directory.empty()) {
    std::filesystem::create_directories(context.directory, ec);
    if (ec) {
      result.status = nwpprof::core::Status::IoError;
      result.message = fmt::format("failed to create {}: {}", context.directory.string(), ec.message());
      return result;
    }
  }

  std::ofstream out(result.path);
  if (!out) {
    result.status = nwpprof::core::Status::IoError;
    result.message = fmt::format("failed to open {}", result.path.string());
    return result;
  }
  write_to(out, series, context);
  out.flush();
  if (!out) {
    result.status = nwpprof::core::Status::IoError;
    result.message = fmt::format("failed to write {}", result.path.string());
  }
  return result;
}

}  // namespace nwpprof::io
