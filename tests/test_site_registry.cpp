/**
 * @file test_site_registry.cpp
 * @brief Site registry CSV loading and selection tests.
 * @author Watosn
 */

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "nwpprof/sites/site_registry.hpp"

namespace {

bool write_csv(const std::filesystem::path& p) {
  std::ofstream out(p);
  if (!out) {
    return false;
  }
  out << "id,name,latitude,longitude\n";
  out << "hyytiala,Hyytiälä,61.844,24.287\n";
  out << "# decommissioned\n";
  out << "mace-head,Mace Head,53.326,-9.9\n";
  out << "\n";
  out << "mobile,Mobile platform,,\n";
  out << "broken,Broken row,north,24.0\n";
  out << "polar,Too far north,91.0,0.0\n";
  out << "lindenberg, Lindenberg ,52.208,14.118\r\n";
  out << "juelich,\"Jülich, \"\"JOYCE\"\" site\",50.909,6.413\n";
  return true;
}

}  // namespace

int main() {
  namespace fs = std::filesystem;
  using nwpprof::sites::SiteRegistry;

  const auto csv = fs::temp_directory_path() / "nwpprof_sites_test.csv";
  if (!write_csv(csv)) {
    spdlog::error("failed to write csv");
    return 10;
  }

  const auto registry = SiteRegistry::Create({.csv_file = csv});
  if (registry->status() != nwpprof::core::Status::Ok || registry->sites().size() != 4 ||
      registry->skipped_rows() != 3) {
    spdlog::error("registry load wrong: {} sites, {} skipped", registry->sites().size(), registry->skipped_rows());
    return 1;
  }
  const auto& sites = registry->sites();
  if (sites[0].id != "hyytiala" || sites[1].id != "mace-head" || sites[2].id != "lindenberg" ||
      sites[2].name != "Lindenberg" || sites[1].lon_deg != -9.9 || sites[0].lat_deg != 61.844) {
    spdlog::error("registry rows parsed incorrectly");
    return 2;
  }
  if (sites[3].id != "juelich" || sites[3].name != "Jülich, \"JOYCE\" site" || sites[3].lat_deg != 50.909 ||
      sites[3].lon_deg != 6.413) {
    spdlog::error("quoted name with comma parsed incorrectly: {}", sites[3].name);
    return 8;
  }

  const auto all = registry->select({});
  if (all.sites.size() != 4 || !all.unknown_ids.empty()) {
    spdlog::error("empty selection must return every site");
    return 3;
  }

  const auto subset = registry->select(nwpprof::sites::split_ids("lindenberg, hyytiala,,"));
  if (subset.sites.size() != 2 || subset.sites[0].id != "hyytiala" || subset.sites[1].id != "lindenberg" ||
      !subset.unknown_ids.empty()) {
    spdlog::error("subset must keep registry order");
    return 4;
  }

  const auto invalid = registry->select({"hyytiala", "mobile", "nowhere", "mobile"});
  if (invalid.unknown_ids != std::vector<std::string>{"mobile", "nowhere"} || invalid.sites.size() != 1) {
    spdlog::error("unknown ids not reported");
    return 5;
  }

  const auto coords = nwpprof::sites::coordinates(registry->sites());
  if (coords.size() != 4 || coords[1].lat_deg != 53.326 || coords[1].lon_deg != -9.9) {
    spdlog::error("coordinates not extracted in order");
    return 6;
  }

  const auto missing = SiteRegistry::Create({.csv_file = fs::temp_directory_path() / "nwpprof_no_such_sites.csv"});
  if (missing->status() != nwpprof::core::Status::IoError || !missing->sites().empty()) {
    spdlog::error("missing registry file must report an I/O error");
    return 7;
  }

  fs::remove(csv);
  return 0;
}
