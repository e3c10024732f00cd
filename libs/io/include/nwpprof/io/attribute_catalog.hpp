/**
 * @file attribute_catalog.hpp
 * @brief Output variable attributes of the profile file format.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace nwpprof::io {

/**
 * @brief Dimensions an output variable spans.
 */
enum class Dimensions : std::uint8_t { Scalar, Time, TimeLevel };

/**
 * @brief Per-variable attributes. Empty strings mean "attribute absent".
 */
struct VariableAttributes {
  std::string name{};
  std::string units{};
  std::string long_name{};
  Dimensions dimensions{Dimensions::Scalar};
  std::string standard_name{};
  std::string comment{};
};

/**
 * @brief Ordered attribute catalogue of every written variable except `time`.
 */
[[nodiscard]] const std::vector<VariableAttributes>& profile_attributes();

}  // namespace nwpprof::io
