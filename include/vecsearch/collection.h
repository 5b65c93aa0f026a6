#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "vecsearch/bruteforce_index.h"
#include "vecsearch/config.h"
#include "vecsearch/hnsw_index.h"
#include "vecsearch/record_store.h"
#include "vecsearch/search_control.h"
#include "vecsearch/types.h"

namespace vecsearch {

struct CollectionInfo {
  CollectionConfig config;
  std::size_t live_records = 0;
  std::size_t tombstoned_slots = 0;
  double tombstone_density = 0.0;
  std::size_t graph_nodes = 0;
  std::size_t graph_edges = 0;
  int max_level = -1;
  std::optional<RecordId> entry_point;
  std::size_t pending_index_events = 0;
  std::size_t tombstone_warnings = 0; // density warnings since creation
  bool halted = false;
  std::string halt_reason;
};

// Point-in-time copy of a collection: live records plus the graph over them.
struct CollectionSnapshot {
  CollectionConfig config;
  std::vector<VectorRecord> records;
  std::vector<GraphNode> nodes;
};

struct SearchOptions {
  std::size_t top_k = 10;
  std::optional<std::size_t> ef_search;
  Filter filter;
  SearchControl control;
  bool exact = false; // bypass the graph
};

struct CollectionSearchResult {
  std::vector<SearchHit> hits;
  SearchStats stats;
  std::size_t ef_used = 0;
  bool ef_raised = false; // requested ef was below top_k
};

struct CompactionReport {
  std::size_t slots_reclaimed = 0;
  std::size_t live_records = 0;
  double duration_ms = 0.0;
};

// Collection
// ----------
// One named vector space: a RecordStore, the HnswIndex over it and an exact
// fallback for tiny collections.
//
// Writes append to the store and queue the new slot for linking, then drain
// the queue. Retired slots need no graph work until compaction. A record is therefore searchable once the call that wrote it (or a
// concurrent writer draining for it) has linked its node.
//
// maintenance_mutex_ is held shared by reads and writes, and exclusively by
// compact(), rebuild_index() and snapshot(). No reader ever observes a
// renumbering in progress.
class Collection {
public:
  using WriteObserver = std::function<void(const std::string& collection)>;

  explicit Collection(CollectionConfig config);

  Collection(const Collection&) = delete;
  Collection& operator=(const Collection&) = delete;

  const std::string& name() const noexcept { return config_.name; }
  std::size_t dimension() const noexcept { return config_.dimension; }
  Metric metric() const noexcept { return config_.metric; }
  bool rerank_enabled() const noexcept { return config_.rerank_enabled; }

  // Live records.
  std::size_t size() const { return store_.live_count(); }

  // Current config (index params change on rebuild).
  CollectionConfig config() const;
  CollectionInfo info() const;

  // Returns the record's new version. Throws DimensionMismatch,
  // InvalidParameter, IndexCorruptionDetected (halted), or
  // ConcurrentModificationConflict if the internal retry also loses.
  std::uint64_t upsert(const RecordId& id, const float* vec_data, std::size_t dim, Payload payload = {});
  std::uint64_t upsert(const RecordId& id, const Vector& vec, Payload payload = {}) {
    return upsert(id, vec.data(), vec.size(), std::move(payload));
  }

  // False if the id is unknown or already deleted.
  bool remove(const RecordId& id);

  VectorRecord get(const RecordId& id) const;
  std::optional<Vector> vector_of(const RecordId& id) const;
  RecordCursor scan(Filter filter = Filter()) const;

  // Empty result (not an error) when the collection has no live records.
  CollectionSearchResult search(const float* query, std::size_t dim, const SearchOptions& options) const;
  CollectionSearchResult search(const Vector& query, const SearchOptions& options) const {
    return search(query.data(), query.size(), options);
  }

  CompactionReport compact();

  // Rebuilds the graph from the live records, optionally with new params.
  void rebuild_index(std::optional<IndexParams> params = std::nullopt);

  CollectionSnapshot snapshot() const;

  // Creates a collection from a snapshot. Broken graph references leave the
  // collection halted for writes until compact() or rebuild_index().
  static std::unique_ptr<Collection> restore(const CollectionSnapshot& snapshot);

  // Runs HnswIndex::verify(); on failure the collection is halted and the
  // error rethrown.
  void verify_index();

  bool halted() const noexcept { return halted_.load(std::memory_order_acquire); }

  // Called after every successful write, outside the store and graph locks.
  void set_write_observer(WriteObserver observer);

private:
  void ensure_writable() const;
  void halt(const std::string& reason);
  void clear_halt();

  void enqueue(Slot slot);
  void drain_index_events();
  void after_write();

  std::vector<SearchHit> materialize(const RecordStore::ReadView& view, std::vector<Candidate> candidates,
                                     const char* source) const;

  CollectionConfig config_;

  mutable std::shared_mutex maintenance_mutex_;
  RecordStore store_;
  BruteForceIndex exact_;
  std::unique_ptr<HnswIndex> index_;

  mutable std::mutex events_mutex_;
  std::deque<Slot> events_; // slots waiting to be linked

  std::atomic<bool> halted_{false};
  mutable std::mutex status_mutex_; // halt_reason_, observer_
  std::string halt_reason_;
  WriteObserver observer_;

  // Retired-slot count that triggers the next density warning; doubles after
  // each warning and resets on compaction.
  std::atomic<std::size_t> next_tombstone_warning_{0};
  std::atomic<std::size_t> tombstone_warnings_{0};
};

} // namespace vecsearch
