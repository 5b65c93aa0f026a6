#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "vecsearch/aligned_allocator.h"
#include "vecsearch/distance.h"
#include "vecsearch/types.h"

namespace vecsearch {

// Physical row number inside a RecordStore. Graph nodes are addressed by slot.
using Slot = std::uint32_t;
constexpr Slot kNoSlot = std::numeric_limits<Slot>::max();

struct UpsertResult {
  Slot slot = kNoSlot;
  Slot retired = kNoSlot; // previous slot of the same id, if any
  std::uint64_t version = 0;
  bool created = false;
};

class RecordCursor;

// RecordStore
// -----------
// Owns vectors, payloads, tombstones and versions for one collection.
//
// Embeddings live in one flat, 32-byte aligned array (row i starts at
// i * dim). A slot is written once and never modified: re-upserting an id
// appends a new row and retires the old one, so a reader holding a ReadView
// never sees a half-written vector. Retired rows are reclaimed by compact().
//
// Thread safety: all methods are safe to call concurrently. Writers take the
// store's mutex exclusively for the append only.

class RecordStore {
public:
  RecordStore(std::size_t dim, Metric metric);

  RecordStore(const RecordStore&) = delete;
  RecordStore& operator=(const RecordStore&) = delete;

  std::size_t dim() const noexcept { return dim_; }
  Metric metric() const noexcept { return metric_; }

  std::size_t live_count() const;
  std::size_t slot_count() const;
  std::size_t retired_count() const;

  // Share of physical slots that are retired (0 when empty).
  double tombstone_density() const;

  // Inserts or replaces `id`. `dim` must match the store's dimension.
  // With `expected_version`, fails with ConcurrentModificationConflict unless
  // the id's current version (0 for unknown ids) equals it.
  UpsertResult upsert(const RecordId& id, const float* vec_data, std::size_t dim, Payload payload,
                      std::optional<std::uint64_t> expected_version = std::nullopt);

  UpsertResult upsert(const RecordId& id, const Vector& vec, Payload payload,
                      std::optional<std::uint64_t> expected_version = std::nullopt) {
    return upsert(id, vec.data(), vec.size(), std::move(payload), expected_version);
  }

  // Tombstones `id`. Returns the retired slot, or nullopt if the id is
  // unknown or already deleted.
  std::optional<Slot> remove(const RecordId& id);

  // Throws NotFound for unknown and deleted ids.
  VectorRecord get(const RecordId& id) const;

  // Like get(), but can also return the tombstoned record (deleted == true).
  std::optional<VectorRecord> lookup(const RecordId& id, bool include_deleted = false) const;

  // 0 when the id has never been written (or was compacted away).
  std::uint64_t version_of(const RecordId& id) const;

  // Live records matching `filter`, in slot order.
  RecordCursor scan(Filter filter = Filter()) const;

  // Appends a record exactly as given (version included). Used when
  // restoring a snapshot; fails with AlreadyExists if the id is present.
  Slot restore(const VectorRecord& record);

  // Drops retired slots and renumbers the rest. Returns old slot -> new slot
  // (kNoSlot for dropped rows). Callers must ensure nothing holds slot
  // numbers across the call.
  std::vector<Slot> compact();

  // Bumped by every compaction.
  std::uint64_t epoch() const noexcept;

  // ReadView
  // --------
  // Shared-locked view for index traversal. Pointers returned by vector()
  // stay valid for the lifetime of the view. Do not hold a view while
  // writing to the same store from the same thread.
  class ReadView {
  public:
    std::size_t dim() const noexcept { return store_->dim_; }
    Metric metric() const noexcept { return store_->metric_; }
    std::size_t slot_count() const noexcept { return store_->slots_.size(); }
    std::size_t live_count() const noexcept { return store_->slots_.size() - store_->retired_; }

    bool valid(Slot s) const noexcept { return s < store_->slots_.size(); }
    bool is_live(Slot s) const noexcept { return valid(s) && !store_->slots_[s].retired; }

    const float* vector(Slot s) const noexcept { return store_->data_.data() + (static_cast<std::size_t>(s) * store_->dim_); }
    float norm(Slot s) const noexcept { return store_->norms_[s]; }
    const RecordId& id(Slot s) const noexcept { return store_->slots_[s].id; }
    const Payload& payload(Slot s) const noexcept { return store_->slots_[s].payload; }
    std::uint64_t version(Slot s) const noexcept { return store_->slots_[s].version; }

    // Slot currently holding the live row of `id`, or kNoSlot.
    Slot find(const RecordId& id) const;

    float distance(const float* query, float query_norm, Slot s) const noexcept {
      return vecsearch::distance(store_->metric_, query, query_norm, vector(s), norm(s), store_->dim_);
    }
    float distance(Slot a, Slot b) const noexcept {
      return vecsearch::distance(store_->metric_, vector(a), norm(a), vector(b), norm(b), store_->dim_);
    }

    VectorRecord record(Slot s) const;

  private:
    friend class RecordStore;
    explicit ReadView(const RecordStore* store) : store_(store), lock_(store->mutex_) {}

    const RecordStore* store_;
    std::shared_lock<std::shared_mutex> lock_;
  };

  ReadView read() const { return ReadView(this); }

private:
  friend class RecordCursor;

  struct SlotMeta {
    RecordId id;
    Payload payload;
    std::uint64_t version = 0;
    bool retired = false;
  };

  // Latest state of an id. `slot` keeps pointing at the tombstoned row after
  // a delete so lookup(include_deleted) can still return it.
  struct Entry {
    Slot slot = kNoSlot;
    std::uint64_t version = 0;
    bool deleted = false;
  };

  Slot append_locked(const RecordId& id, const float* vec_data, float norm, Payload payload,
                     std::uint64_t version);
  VectorRecord record_locked(Slot s) const;
  void validate_vector(const float* vec_data, std::size_t dim) const;

  std::size_t dim_ = 0;
  Metric metric_ = Metric::COSINE;

  mutable std::shared_mutex mutex_;

  // Flat contiguous memory: [slots_.size() * dim_]
  AlignedFloats data_;
  std::vector<float> norms_;
  std::vector<SlotMeta> slots_;
  std::unordered_map<RecordId, Entry> ids_;
  std::size_t retired_ = 0;
  std::atomic<std::uint64_t> epoch_{0};
};

// RecordCursor
// ------------
// Lazy, finite, restartable iteration over a store's live records. Each
// next() copies one record under a short shared lock, so writers are never
// blocked for the whole scan. Rows appended during the scan may or may not be
// visited; a compaction during the scan ends it (next() returns nullopt).
class RecordCursor {
public:
  std::optional<VectorRecord> next();
  void reset() noexcept;

private:
  friend class RecordStore;
  RecordCursor(const RecordStore* store, Filter filter, std::uint64_t epoch)
      : store_(store), filter_(std::move(filter)), epoch_(epoch) {}

  const RecordStore* store_;
  Filter filter_;
  std::uint64_t epoch_;
  Slot position_ = 0;
};

} // namespace vecsearch
