/**
 * @file types.hpp
 * @brief Core domain types for nwpprof.
 * @author Watosn
 */
#pragma once

#include <cstdint>

namespace nwpprof::core {

/**
 * @brief Standard status code used by extraction, I/O and adapter outputs.
 */
enum class Status : std::uint8_t {
  Ok,
  InvalidInput,
  DataUnavailable,
  IoError,
  UnsupportedGrid,
  GridMismatch,
  TimeMismatch,
  UnitMismatch,
  PressureCoordinateDrift,
};

/**
 * @brief Proleptic Gregorian calendar date (UTC).
 */
struct CivilDate {
  int year{};
  unsigned month{};
  unsigned day{};
};

inline bool operator==(const CivilDate& a, const CivilDate& b) {
  return a.year == b.year && a.month == b.month && a.day == b.day;
}
inline bool operator!=(const CivilDate& a, const CivilDate& b) { return !(a == b); }

/**
 * @brief Target location in geographic coordinates.
 */
struct SiteCoordinate {
  double lat_deg{};
  double lon_deg{};
};

}  // namespace nwpprof::core
