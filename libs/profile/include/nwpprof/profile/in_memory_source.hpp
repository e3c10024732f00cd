/**
 * @file in_memory_source.hpp
 * @brief Snapshot source over already-decoded fields.
 * @author Watosn
 */
#pragma once

#include <utility>
#include <vector>

#include "nwpprof/core/interfaces.hpp"

namespace nwpprof::profile {

/**
 * @brief In-memory snapshot source for testing and deterministic runs.
 */
class InMemorySnapshotSource final : public nwpprof::core::ISnapshotSource {
 public:
  explicit InMemorySnapshotSource(std::vector<nwpprof::core::Snapshot> snapshots) : snapshots_(std::move(snapshots)) {}

  [[nodiscard]] std::size_t size() const override { return snapshots_.size(); }

  [[nodiscard]] nwpprof::core::SnapshotLoad for_each_field(std::size_t index,
                                                           const nwpprof::core::FieldVisitor& visit) const override {
    if (index >= snapshots_.size()) {
      return nwpprof::core::SnapshotLoad{.status = nwpprof::core::Status::InvalidInput,
                                         .message = "snapshot index out of range"};
    }
    for (const auto& field : snapshots_[index]) {
      if (!visit(field)) {
        break;
      }
    }
    return {};
  }

 private:
  std::vector<nwpprof::core::Snapshot> snapshots_{};
};

}  // namespace nwpprof::profile
