#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "vecsearch/config.h"
#include "vecsearch/record_store.h"
#include "vecsearch/search_control.h"

namespace vecsearch {

// Portable form of one graph node, addressed by record id rather than slot.
// Used for snapshots.
struct GraphNode {
  RecordId record_id;
  int level = 0;
  // neighbors[l] = (record id, distance) pairs at layer l, closest first.
  std::vector<std::vector<std::pair<RecordId, float>>> neighbors;
};

struct GraphStats {
  std::size_t nodes = 0;
  std::size_t retired_nodes = 0; // nodes whose record slot is tombstoned
  std::size_t edges = 0;
  int max_level = -1;
};

// HnswIndex
// ---------
// Hierarchical navigable small-world graph over the slots of a RecordStore.
//
// - Node arena indexed by slot; adjacency per layer holds (slot, distance).
// - Layer of a new node: floor(-ln(U) / ln(M)) from a seeded generator.
// - Up to M links per upper layer, 2M at layer 0, chosen with the
//   diversity heuristic (a candidate is kept only if it is closer to the new
//   node than to every neighbor kept so far).
// - Tombstoned nodes stay navigable; they are filtered when a node enters the
//   result set.
//
// Locking: graph_mutex_ is held exclusively only to add a node to the arena
// or move the entry point; linking and searching run under the shared lock,
// with each neighbor list guarded by its node's mutex. Searches copy a list
// before walking it, so they see a node either before or after a relink. The
// graph lock is always taken before the store's read lock.

class HnswIndex {
public:
  HnswIndex(const RecordStore& store, IndexParams params, std::uint64_t seed = 42);

  HnswIndex(const HnswIndex&) = delete;
  HnswIndex& operator=(const HnswIndex&) = delete;

  const IndexParams& params() const noexcept { return params_; }

  std::size_t size() const;
  bool contains(Slot s) const;
  Slot entry_point() const;
  int max_level() const;
  GraphStats stats() const;

  // Links the row at `s` into the graph. The slot must already be in the
  // store. Safe to call concurrently with other inserts and searches.
  void insert(Slot s);

  // Approximate top-k, closest first. `ef` is raised to k if smaller.
  // Only live slots accepted by `accept` (if set) are returned.
  std::vector<Candidate> search(const float* query, std::size_t k, std::size_t ef,
                                const SlotPredicate& accept = {}, const SearchControl& control = {},
                                SearchStats* stats = nullptr) const;

  // Renumbers nodes after RecordStore::compact(). `remap` is that call's
  // result; the store must already be compacted. Lists that lost a neighbor
  // are re-selected from their surviving neighbors plus the neighbors of the
  // removed ones. Requires that no search or insert runs concurrently.
  void compact(const std::vector<Slot>& remap);

  // Throws IndexCorruptionDetected on the first structural problem found.
  void verify() const;

  // Live nodes only; neighbor lists restricted to live records.
  std::vector<GraphNode> export_graph() const;

  // Replaces the graph with `nodes`. Node and neighbor ids are resolved
  // against the store. Unresolvable references are dropped and reported in
  // the returned list.
  std::vector<std::string> import_graph(const std::vector<GraphNode>& nodes);

private:
  struct Neighbor {
    Slot slot = kNoSlot;
    float distance = 0.0f;
  };

  struct Node {
    Node(Slot s, int lvl) : slot(s), level(lvl), links(static_cast<std::size_t>(lvl) + 1) {}

    Slot slot;
    int level;
    std::vector<std::vector<Neighbor>> links;
    mutable std::mutex mutex;
  };

  using View = RecordStore::ReadView;

  std::size_t max_links(int level) const noexcept { return level == 0 ? 2 * params_.M : params_.M; }

  int draw_level();
  const Node* node_at(Slot s) const noexcept;
  std::vector<Neighbor> copy_links(const Node& n, int level) const;

  Slot greedy_descend(const View& view, const float* query, float query_norm, Slot entry, int from_level,
                      int to_level, SearchStats* stats) const;

  // Best-first search on one layer. Returns up to `ef` accepted candidates,
  // closest first. Expansion ignores acceptance. Retired slots are accepted
  // only with `include_retired`.
  std::vector<Candidate> search_layer(const View& view, const float* query, float query_norm,
                                      const std::vector<Candidate>& entries, std::size_t ef, int level,
                                      const SlotPredicate& accept, bool include_retired,
                                      const SearchControl* control, SearchStats* stats) const;

  // `candidates` must be sorted closest first, distances relative to the
  // base node. With `keep_pruned`, free places are filled with the closest
  // candidates the heuristic rejected (used on layer 0).
  std::vector<Neighbor> select_neighbors(const View& view, const std::vector<Candidate>& candidates,
                                         std::size_t m, bool keep_pruned) const;

  void link(const View& view, Node& node, const std::vector<Neighbor>& selected, int level);
  void add_backlink(const View& view, Node& target, Slot from, float distance, int level);

  void set_entry_locked();

  const RecordStore& store_;
  IndexParams params_;
  double level_mult_;

  mutable std::shared_mutex graph_mutex_;
  std::vector<std::unique_ptr<Node>> nodes_; // index = slot; null when not indexed
  std::size_t node_count_ = 0;
  Slot entry_ = kNoSlot;
  int max_level_ = -1;

  std::mt19937_64 rng_;
};

} // namespace vecsearch
