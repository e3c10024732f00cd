/**
 * @file interfaces.hpp
 * @brief Core collaborator interfaces for forecast input.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <functional>
#include <string>

#include "nwpprof/core/field.hpp"
#include "nwpprof/core/types.hpp"

namespace nwpprof::core {

/**
 * @brief Status of one snapshot pass.
 */
struct SnapshotLoad {
  Status status{Status::Ok};
  std::string message{};
};

/**
 * @brief Receives decoded fields one at a time; return false to stop the pass.
 *
 * The field is only valid for the duration of the call.
 */
using FieldVisitor = std::function<bool(const GriddedField&)>;

/**
 * @brief Interface for chronologically ordered forecast snapshots.
 *
 * Snapshot `i` holds the fields of lead hour `3 * i` from the run start.
 */
class ISnapshotSource {
 public:
  virtual ~ISnapshotSource() = default;
  /**
   * @brief Number of snapshots in the run.
   */
  [[nodiscard]] virtual std::size_t size() const = 0;
  /**
   * @brief Decode one snapshot and hand each field to `visit` in file order.
   * @param index Zero-based snapshot index.
   * @param visit Field consumer.
   * @return Decode status; a pass stopped by `visit` is `Ok`.
   */
  [[nodiscard]] virtual SnapshotLoad for_each_field(std::size_t index, const FieldVisitor& visit) const = 0;
};

}  // namespace nwpprof::core
