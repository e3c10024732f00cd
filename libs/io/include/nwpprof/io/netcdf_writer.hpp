/**
 * @file netcdf_writer.hpp
 * @brief NETCDF4_CLASSIC output of profile time series.
 * @author Watosn
 */
#pragma once

#include "nwpprof/io/profile_writer.hpp"

namespace nwpprof::io {

/**
 * @brief Writes `<stem>.nc` with `time` and `level` dimensions.
 *
 * Every variable is stored as 32-bit float with the attributes of
 * `profile_attributes()`; missing values are written as NaN.
 */
class NetcdfProfileWriter final : public IProfileWriter {
 public:
  [[nodiscard]] WriteResult write(const nwpprof::profile::SiteTimeSeries& series,
                                  const OutputContext& context) const override;
};

}  // namespace nwpprof::io
