/**
 * @file delimited_writer.hpp
 * @brief Text output of profile time series (CSV and JSON lines).
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>

#include "nwpprof/io/profile_writer.hpp"

namespace nwpprof::io {

enum class TextFormat : std::uint8_t { Csv, JsonLines };

/**
 * @brief Writes `<stem>.csv` or `<stem>.jsonl` files.
 *
 * CSV is long format: one row per (time, level) with the surface columns
 * repeated along the level axis. JSON lines emit one record per lead hour
 * with level variables as arrays. Both start with a metadata record holding
 * global and grid-point attributes. Missing values are empty cells in CSV
 * and `null` in JSON.
 */
class DelimitedProfileWriter final : public IProfileWriter {
 public:
  explicit DelimitedProfileWriter(TextFormat format) : format_(format) {}

  [[nodiscard]] WriteResult write(const nwpprof::profile::SiteTimeSeries& series,
                                  const OutputContext& context) const override;

  /**
   * @brief Stream variant used by `write`.
   */
  void write_to(std::ostream& out, const nwpprof::profile::SiteTimeSeries& series,
                const OutputContext& context) const;

  [[nodiscard]] TextFormat format() const noexcept { return format_; }
  [[nodiscard]] std::string extension() const;

 private:
  TextFormat format_{TextFormat::Csv};
};

}  // namespace nwpprof::io
