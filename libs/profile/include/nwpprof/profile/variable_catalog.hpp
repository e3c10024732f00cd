/**
 * @file variable_catalog.hpp
 * @brief Recognised forecast variables with their contractual units and profile slots.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "nwpprof/core/field.hpp"

namespace nwpprof::profile {

/**
 * @brief Scalar slot of a surface-type variable.
 */
enum class SurfaceSlot : std::uint8_t {
  Pressure,
  PressureAmsl,
  Temp2m,
  DewpointTemp2m,
  WindU10m,
  WindV10m,
  SoilTemperature,
};
inline constexpr std::size_t kSurfaceSlotCount = 7;

/**
 * @brief Array slot of a pressure-level variable.
 */
enum class LevelSlot : std::uint8_t {
  GeopotentialHeight,
  Temperature,
  WindU,
  WindV,
  Omega,
  SpecificHumidity,
};
inline constexpr std::size_t kLevelSlotCount = 6;

/**
 * @brief One recognised variable.
 */
struct VariableSpec {
  std::string short_name{};
  std::string units{};
  std::optional<SurfaceSlot> surface_slot{};
  std::optional<LevelSlot> level_slot{};
};

/**
 * @brief Immutable variable configuration owned by a profile assembler.
 */
class VariableCatalog {
 public:
  VariableCatalog(std::vector<VariableSpec> variables, std::vector<nwpprof::core::LevelType> level_types)
      : variables_(std::move(variables)), level_types_(std::move(level_types)) {}

  /**
   * @brief Variables and level types published in the ECMWF open-data subset.
   */
  static VariableCatalog ecmwf_open_data();

  [[nodiscard]] const VariableSpec* find(std::string_view short_name) const noexcept;
  [[nodiscard]] bool recognizes(nwpprof::core::LevelType level_type) const noexcept;
  [[nodiscard]] const std::vector<VariableSpec>& variables() const noexcept { return variables_; }

 private:
  std::vector<VariableSpec> variables_{};
  std::vector<nwpprof::core::LevelType> level_types_{};
};

}  // namespace nwpprof::profile
