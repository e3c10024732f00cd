/**
 * @file profile_writer.cpp
 * @brief Shared output naming helpers.
 * @author Watosn
 */

#include "nwpprof/io/profile_writer.hpp"

#include <fmt/format.h>

#ifndef NWPPROF_VERSION
#error "NWPPROF_VERSION must be defined by the build"
#endif

namespace nwpprof::io {

std::string output_stem(const OutputContext& context) {
  return fmt::format("{:04d}{:02d}{:02d}_{}_{}", context.date.year, context.date.month, context.date.day,
                     context.site_id, context.model_tag);
}

std::string time_units(const nwpprof::core::CivilDate& date) {
  return fmt::format("hours since {:04d}-{:02d}-{:02d} 00:00:00 +00:00", date.year, date.month, date.day);
}

const char* producer_version() { return NWPPROF_VERSION; }

}  // namespace nwpprof::io
