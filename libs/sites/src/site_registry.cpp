/**
 * @file site_registry.cpp
 * @brief CSV site registry implementation.
 * @author Watosn
 */

#include "nwpprof/sites/site_registry.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace nwpprof::sites {
namespace {

constexpr std::size_t kMinSiteColumns = 4;
constexpr std::size_t kIdCol = 0;
constexpr std::size_t kNameCol = 1;
constexpr std::size_t kLatCol = 2;
constexpr std::size_t kLonCol = 3;

// Double-quoted fields may hold commas; `""` inside quotes is a literal quote.
std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> fields;
  fields.reserve(kMinSiteColumns);
  std::string token;
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c != '"') {
        token.push_back(c);
      } else if (i + 1 < line.size() && line[i + 1] == '"') {
        token.push_back('"');
        ++i;
      } else {
        quoted = false;
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields.push_back(std::move(token));
      token.clear();
    } else {
      token.push_back(c);
    }
  }
  fields.push_back(std::move(token));
  return fields;
}

std::string trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r");
  return text.substr(first, last - first + 1);
}

bool parse_coordinate(const std::string& text, double lo, double hi, double& value) {
  const std::string t = trim(text);
  if (t.empty()) {
    return false;
  }
  std::size_t used = 0;
  try {
    value = std::stod(t, &used);
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
  return used == t.size() && std::isfinite(value) && value >= lo && value <= hi;
}

}  // namespace

std::unique_ptr<SiteRegistry> SiteRegistry::Create(const Config& config) {
  std::ifstream in(config.csv_file);
  if (!in) {
    return std::unique_ptr<SiteRegistry>(new SiteRegistry({}, 0, nwpprof::core::Status::IoError));
  }

  std::vector<SiteRecord> sites;
  std::size_t skipped = 0;
  std::string line;
  bool header_consumed = false;
  while (std::getline(in, line)) {
    if (trim(line).empty() || line.front() == '#') {
      continue;
    }
    if (!header_consumed) {
      header_consumed = true;
      if (line.find("latitude") != std::string::npos) {
        continue;
      }
    }

    const auto fields = split_csv_line(line);
    SiteRecord rec{};
    if (fields.size() < kMinSiteColumns || trim(fields[kIdCol]).empty() ||
        !parse_coordinate(fields[kLatCol], -90.0, 90.0, rec.lat_deg) ||
        !parse_coordinate(fields[kLonCol], -180.0, 360.0, rec.lon_deg)) {
      ++skipped;
      continue;
    }
    rec.id = trim(fields[kIdCol]);
    rec.name = trim(fields[kNameCol]);
    sites.push_back(std::move(rec));
  }

  return std::unique_ptr<SiteRegistry>(new SiteRegistry(std::move(sites), skipped, nwpprof::core::Status::Ok));
}

SiteSelection SiteRegistry::select(const std::vector<std::string>& ids) const {
  SiteSelection out{};
  if (ids.empty()) {
    out.sites = sites_;
    return out;
  }
  for (const auto& id : ids) {
    const bool known = std::any_of(sites_.begin(), sites_.end(), [&id](const SiteRecord& s) { return s.id == id; });
    if (!known && std::find(out.unknown_ids.begin(), out.unknown_ids.end(), id) == out.unknown_ids.end()) {
      out.unknown_ids.push_back(id);
    }
  }
  for (const auto& site : sites_) {
    if (std::find(ids.begin(), ids.end(), site.id) != ids.end()) {
      out.sites.push_back(site);
    }
  }
  return out;
}

std::vector<nwpprof::core::SiteCoordinate> coordinates(const std::vector<SiteRecord>& sites) {
  std::vector<nwpprof::core::SiteCoordinate> out;
  out.reserve(sites.size());
  for (const auto& s : sites) {
    out.push_back(nwpprof::core::SiteCoordinate{.lat_deg = s.lat_deg, .lon_deg = s.lon_deg});
  }
  return out;
}

std::vector<std::string> split_ids(const std::string& text) {
  std::vector<std::string> out;
  std::string token;
  std::stringstream ss(text);
  while (std::getline(ss, token, ',')) {
    token = trim(token);
    if (!token.empty()) {
      out.push_back(token);
    }
  }
  return out;
}

}  // namespace nwpprof::sites
