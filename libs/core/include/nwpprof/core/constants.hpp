/**
 * @file constants.hpp
 * @brief Shared physical constants and unit factors for NWP post-processing.
 * @author Watosn
 */
#pragma once

namespace nwpprof::core::constants {

/// Earth radius assumed by the ECMWF IFS (m).
inline constexpr double kEarthRadiusIfsM = 6371229.0;
/// Molecular weight ratio of water vapour to dry air.
inline constexpr double kMolecularWeightRatio = 0.62198;
/// Triple point of water (K).
inline constexpr double kTriplePointK = 273.16;
inline constexpr double kHpaToPa = 100.0;
inline constexpr double kMToKm = 1e-3;
/// Lead-hour spacing between consecutive forecast snapshots (h).
inline constexpr int kLeadHourStepH = 3;

}  // namespace nwpprof::core::constants
