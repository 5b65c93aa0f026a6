#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>

#include "vecsearch/record_store.h"

namespace vecsearch {

// (distance, slot) pair. Ordering is by distance, then by slot, so equal
// distances always resolve to the earlier-inserted row.
struct Candidate {
  float distance = 0.0f;
  Slot slot = kNoSlot;
};

struct CloserFirst {
  bool operator()(const Candidate& a, const Candidate& b) const noexcept {
    return a.distance < b.distance || (a.distance == b.distance && a.slot < b.slot);
  }
};

// Heap comparator: top() is the farthest (max-heap on distance).
struct FartherOnTop {
  bool operator()(const Candidate& a, const Candidate& b) const noexcept { return CloserFirst{}(a, b); }
};

// Heap comparator: top() is the closest (min-heap on distance).
struct CloserOnTop {
  bool operator()(const Candidate& a, const Candidate& b) const noexcept { return CloserFirst{}(b, a); }
};

// Decides which live slots may enter a result set. Called with the read view
// the search is running under.
using SlotPredicate = std::function<bool(const RecordStore::ReadView&, Slot)>;

// CancellationToken
// -----------------
// Shared flag a caller flips to abandon an in-flight search. Copies share the
// same flag.
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() noexcept { flag_->store(true, std::memory_order_release); }
  bool cancelled() const noexcept { return flag_->load(std::memory_order_acquire); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

// Checked at node-expansion granularity.
struct SearchControl {
  const CancellationToken* cancel = nullptr;
  std::optional<std::chrono::steady_clock::time_point> deadline;

  // True once the search must stop. Records which condition fired.
  bool should_stop(bool& cancelled, bool& deadline_hit) const noexcept {
    if (cancel && cancel->cancelled()) {
      cancelled = true;
      return true;
    }
    if (deadline && std::chrono::steady_clock::now() >= *deadline) {
      deadline_hit = true;
      return true;
    }
    return false;
  }
};

struct SearchStats {
  std::size_t ef_used = 0;
  std::size_t nodes_expanded = 0;
  std::size_t distance_evaluations = 0;

  // Layer-0 nodes offered to the result set, and how many the predicate let
  // in (tombstones and filter misses are rejected).
  std::size_t candidates_considered = 0;
  std::size_t candidates_accepted = 0;

  bool exact = false;
  bool cancelled = false;
  bool deadline_hit = false;

  double recall_proxy() const noexcept {
    return candidates_considered == 0
               ? 1.0
               : static_cast<double>(candidates_accepted) / static_cast<double>(candidates_considered);
  }
};

} // namespace vecsearch
