/**
 * @file time.hpp
 * @brief Calendar date helpers.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "nwpprof/core/types.hpp"

namespace nwpprof::core {

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian date.
 */
inline int days_from_civil(int y, unsigned m, unsigned d) {
  y -= static_cast<int>(m <= 2);
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153U * (m + (m > 2 ? -3U : 9U)) + 2U) / 5U + d - 1U;
  const unsigned doe = yoe * 365U + yoe / 4U - yoe / 100U + doy;
  return era * 146097 + static_cast<int>(doe) - 719468;
}

/**
 * @brief Inverse of days_from_civil.
 */
inline CivilDate civil_from_days(int z) {
  z += 719468;
  const int era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460U + doe / 36524U - doe / 146096U) / 365U;
  const int y = static_cast<int>(yoe) + era * 400;
  const unsigned doy = doe - (365U * yoe + yoe / 4U - yoe / 100U);
  const unsigned mp = (5U * doy + 2U) / 153U;
  const unsigned d = doy - (153U * mp + 2U) / 5U + 1U;
  const unsigned m = mp < 10U ? mp + 3U : mp - 9U;
  return CivilDate{.year = y + static_cast<int>(m <= 2U), .month = m, .day = d};
}

/**
 * @brief True when the date exists in the Gregorian calendar.
 */
inline bool is_valid_date(const CivilDate& date) {
  if (date.month < 1U || date.month > 12U || date.day < 1U || date.day > 31U) {
    return false;
  }
  return civil_from_days(days_from_civil(date.year, date.month, date.day)) == date;
}

/**
 * @brief Parse `YYYY-MM-DD`.
 */
inline std::optional<CivilDate> parse_iso_date(const std::string& text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (i != 4 && i != 7 && (text[i] < '0' || text[i] > '9')) {
      return std::nullopt;
    }
  }
  const auto digits = [&text](std::size_t pos, std::size_t len) {
    unsigned value = 0U;
    for (std::size_t i = pos; i < pos + len; ++i) {
      value = value * 10U + static_cast<unsigned>(text[i] - '0');
    }
    return value;
  };
  const CivilDate date{.year = static_cast<int>(digits(0, 4)), .month = digits(5, 2), .day = digits(8, 2)};
  if (!is_valid_date(date)) {
    return std::nullopt;
  }
  return date;
}

/**
 * @brief Convert a packed GRIB `dataDate` (YYYYMMDD) to a calendar date.
 */
inline CivilDate date_from_yyyymmdd(long packed) {
  return CivilDate{.year = static_cast<int>(packed / 10000),
                   .month = static_cast<unsigned>((packed / 100) % 100),
                   .day = static_cast<unsigned>(packed % 100)};
}

}  // namespace nwpprof::core
