#include "vecsearch/hnsw_index.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <queue>
#include <stdexcept>
#include <unordered_set>

#include "vecsearch/errors.h"

namespace vecsearch {

namespace {
// Levels above this are never assigned; with M >= 2 reaching it needs U < 2^-16.
constexpr int kMaxLevel = 16;
}

HnswIndex::HnswIndex(const RecordStore& store, IndexParams params, std::uint64_t seed)
    : store_(store), params_(params), rng_(seed) {
  params_.validate();
  level_mult_ = 1.0 / std::log(static_cast<double>(params_.M));
}

std::size_t HnswIndex::size() const {
  std::shared_lock<std::shared_mutex> lock(graph_mutex_);
  return node_count_;
}

bool HnswIndex::contains(Slot s) const {
  std::shared_lock<std::shared_mutex> lock(graph_mutex_);
  return node_at(s) != nullptr;
}

Slot HnswIndex::entry_point() const {
  std::shared_lock<std::shared_mutex> lock(graph_mutex_);
  return entry_;
}

int HnswIndex::max_level() const {
  std::shared_lock<std::shared_mutex> lock(graph_mutex_);
  return max_level_;
}

GraphStats HnswIndex::stats() const {
  std::shared_lock<std::shared_mutex> lock(graph_mutex_);
  const auto view = store_.read();

  GraphStats out;
  out.nodes = node_count_;
  out.max_level = max_level_;
  for (const auto& n : nodes_) {
    if (!n) {
      continue;
    }
    if (!view.is_live(n->slot)) {
      ++out.retired_nodes;
    }
    std::lock_guard<std::mutex> g(n->mutex);
    for (const auto& layer : n->links) {
      out.edges += layer.size();
    }
  }
  return out;
}

int HnswIndex::draw_level() {
  std::uniform_real_distribution<double> unif(0.0, 1.0);
  const double u = 1.0 - unif(rng_); // (0, 1]
  const int level = static_cast<int>(std::floor(-std::log(u) * level_mult_));
  return std::min(level, kMaxLevel);
}

const HnswIndex::Node* HnswIndex::node_at(Slot s) const noexcept {
  return (s < nodes_.size()) ? nodes_[s].get() : nullptr;
}

std::vector<HnswIndex::Neighbor> HnswIndex::copy_links(const Node& n, int level) const {
  if (level > n.level) {
    return {};
  }
  std::lock_guard<std::mutex> g(n.mutex);
  return n.links[static_cast<std::size_t>(level)];
}

Slot HnswIndex::greedy_descend(const View& view, const float* query, float query_norm, Slot entry,
                               int from_level, int to_level, SearchStats* stats) const {
  Slot current = entry;
  float current_dist = view.distance(query, query_norm, current);
  if (stats) {
    ++stats->distance_evaluations;
  }

  for (int level = from_level; level > to_level; --level) {
    bool changed = true;
    while (changed) {
      changed = false;
      const Node* node = node_at(current);
      if (!node) {
        break;
      }
      if (stats) {
        ++stats->nodes_expanded;
      }
      for (const Neighbor& nb : copy_links(*node, level)) {
        const float d = view.distance(query, query_norm, nb.slot);
        if (stats) {
          ++stats->distance_evaluations;
        }
        if (d < current_dist || (d == current_dist && nb.slot < current)) {
          current = nb.slot;
          current_dist = d;
          changed = true;
        }
      }
    }
  }
  return current;
}

std::vector<Candidate> HnswIndex::search_layer(const View& view, const float* query, float query_norm,
                                               const std::vector<Candidate>& entries, std::size_t ef, int level,
                                               const SlotPredicate& accept, bool include_retired,
                                               const SearchControl* control, SearchStats* stats) const {
  auto admit = [&](Slot s) { return (include_retired || view.is_live(s)) && (!accept || accept(view, s)); };

  std::vector<std::uint8_t> visited(nodes_.size(), 0);
  std::priority_queue<Candidate, std::vector<Candidate>, CloserOnTop> frontier;
  std::priority_queue<Candidate, std::vector<Candidate>, FartherOnTop> results;

  auto offer = [&](const Candidate& c) {
    frontier.push(c);
    if (stats) {
      ++stats->candidates_considered;
    }
    if (!admit(c.slot)) {
      return;
    }
    if (stats) {
      ++stats->candidates_accepted;
    }
    results.push(c);
    if (results.size() > ef) {
      results.pop();
    }
  };

  for (const Candidate& e : entries) {
    if (e.slot >= visited.size() || visited[e.slot]) {
      continue;
    }
    visited[e.slot] = 1;
    offer(e);
  }

  bool cancelled = false;
  bool deadline_hit = false;
  while (!frontier.empty()) {
    if (control && control->should_stop(cancelled, deadline_hit)) {
      break;
    }

    const Candidate current = frontier.top();
    // Nothing left in the frontier can improve a full result set.
    if (results.size() >= ef && CloserFirst{}(results.top(), current)) {
      break;
    }
    frontier.pop();

    const Node* node = node_at(current.slot);
    if (!node) {
      continue;
    }
    if (stats) {
      ++stats->nodes_expanded;
    }

    for (const Neighbor& nb : copy_links(*node, level)) {
      if (nb.slot >= visited.size() || visited[nb.slot]) {
        continue;
      }
      visited[nb.slot] = 1;

      const Candidate c{view.distance(query, query_norm, nb.slot), nb.slot};
      if (stats) {
        ++stats->distance_evaluations;
      }
      if (results.size() < ef || CloserFirst{}(c, results.top())) {
        offer(c);
      }
    }
  }

  if (stats) {
    stats->cancelled = stats->cancelled || cancelled;
    stats->deadline_hit = stats->deadline_hit || deadline_hit;
  }

  std::vector<Candidate> out;
  out.reserve(results.size());
  while (!results.empty()) {
    out.push_back(results.top());
    results.pop();
  }
  std::reverse(out.begin(), out.end());
  return out;
}

std::vector<HnswIndex::Neighbor> HnswIndex::select_neighbors(const View& view,
                                                             const std::vector<Candidate>& candidates,
                                                             std::size_t m, bool keep_pruned) const {
  std::vector<Neighbor> out;
  std::vector<Neighbor> pruned;
  out.reserve(std::min(m, candidates.size()));

  for (const Candidate& c : candidates) {
    if (out.size() >= m) {
      break;
    }
    bool diverse = true;
    for (const Neighbor& kept : out) {
      if (view.distance(c.slot, kept.slot) < c.distance) {
        diverse = false;
        break;
      }
    }
    if (diverse) {
      out.push_back(Neighbor{c.slot, c.distance});
    } else if (keep_pruned) {
      pruned.push_back(Neighbor{c.slot, c.distance});
    }
  }

  // Top up with the closest rejected candidates; the result stays sorted.
  if (keep_pruned && out.size() < m && !pruned.empty()) {
    for (std::size_t i = 0; i < pruned.size() && out.size() < m; ++i) {
      out.push_back(pruned[i]);
    }
    std::sort(out.begin(), out.end(), [](const Neighbor& a, const Neighbor& b) {
      return CloserFirst{}(Candidate{a.distance, a.slot}, Candidate{b.distance, b.slot});
    });
  }
  return out;
}

void HnswIndex::link(const View& view, Node& node, const std::vector<Neighbor>& selected, int level) {
  {
    std::lock_guard<std::mutex> g(node.mutex);
    node.links[static_cast<std::size_t>(level)] = selected;
  }
  // One node mutex at a time; never nested.
  for (const Neighbor& nb : selected) {
    Node* target = nodes_[nb.slot].get();
    if (target) {
      add_backlink(view, *target, node.slot, nb.distance, level);
    }
  }
}

void HnswIndex::add_backlink(const View& view, Node& target, Slot from, float distance, int level) {
  if (level > target.level) {
    return;
  }
  std::lock_guard<std::mutex> g(target.mutex);
  auto& list = target.links[static_cast<std::size_t>(level)];

  for (const Neighbor& nb : list) {
    if (nb.slot == from) {
      return;
    }
  }

  const Neighbor incoming{from, distance};
  auto pos = std::lower_bound(list.begin(), list.end(), incoming, [](const Neighbor& a, const Neighbor& b) {
    return CloserFirst{}(Candidate{a.distance, a.slot}, Candidate{b.distance, b.slot});
  });

  if (list.size() < max_links(level)) {
    list.insert(pos, incoming);
    return;
  }

  std::vector<Candidate> pool;
  pool.reserve(list.size() + 1);
  for (const Neighbor& nb : list) {
    pool.push_back(Candidate{nb.distance, nb.slot});
  }
  pool.push_back(Candidate{distance, from});
  std::sort(pool.begin(), pool.end(), CloserFirst{});
  list = select_neighbors(view, pool, max_links(level), level == 0);
}

void HnswIndex::insert(Slot s) {
  Node* node = nullptr;
  Slot entry = kNoSlot;
  int top = -1;

  {
    std::unique_lock<std::shared_mutex> lock(graph_mutex_);
    if (!store_.read().valid(s)) {
      throw InvalidParameter("slot " + std::to_string(s) + " is not in the record store");
    }
    if (node_at(s)) {
      return;
    }
    if (nodes_.size() <= s) {
      nodes_.resize(static_cast<std::size_t>(s) + 1);
    }

    const int level = draw_level();
    nodes_[s] = std::make_unique<Node>(s, level);
    node = nodes_[s].get();
    ++node_count_;

    if (entry_ == kNoSlot) {
      entry_ = s;
      max_level_ = level;
      return;
    }
    entry = entry_;
    top = max_level_;
  }

  {
    std::shared_lock<std::shared_mutex> lock(graph_mutex_);
    const auto view = store_.read();

    const float* q = view.vector(s);
    const float q_norm = view.norm(s);

    const SlotPredicate not_self = [s](const View&, Slot other) { return other != s; };

    const Slot nearest = greedy_descend(view, q, q_norm, entry, top, node->level, nullptr);
    std::vector<Candidate> entries{Candidate{view.distance(q, q_norm, nearest), nearest}};

    for (int level = std::min(top, node->level); level >= 0; --level) {
      // Linking to retired rows wastes edges, so they are only used when
      // nothing live is reachable.
      std::vector<Candidate> found = search_layer(view, q, q_norm, entries, params_.ef_construction, level,
                                                  not_self, false, nullptr, nullptr);
      if (found.empty()) {
        found = search_layer(view, q, q_norm, entries, params_.ef_construction, level, not_self, true, nullptr,
                             nullptr);
      }
      if (found.empty()) {
        continue;
      }
      link(view, *node, select_neighbors(view, found, params_.M, level == 0), level);
      entries = std::move(found);
    }
  }

  if (node->level > top) {
    std::unique_lock<std::shared_mutex> lock(graph_mutex_);
    if (node->level > max_level_) {
      entry_ = s;
      max_level_ = node->level;
    }
  }
}

std::vector<Candidate> HnswIndex::search(const float* query, std::size_t k, std::size_t ef,
                                         const SlotPredicate& accept, const SearchControl& control,
                                         SearchStats* stats) const {
  if (!query) {
    throw std::invalid_argument("query pointer is null");
  }
  if (k == 0) {
    return {};
  }
  ef = std::max(ef, k);

  SearchStats local;
  SearchStats& st = stats ? *stats : local;
  st.ef_used = ef;

  std::shared_lock<std::shared_mutex> lock(graph_mutex_);
  if (entry_ == kNoSlot) {
    return {};
  }
  const auto view = store_.read();
  const float query_norm = l2_norm(query, view.dim());

  const Slot nearest = greedy_descend(view, query, query_norm, entry_, max_level_, 0, &st);
  const std::vector<Candidate> entries{Candidate{view.distance(query, query_norm, nearest), nearest}};

  std::vector<Candidate> out = search_layer(view, query, query_norm, entries, ef, 0, accept, false, &control, &st);
  if (out.size() > k) {
    out.resize(k);
  }
  return out;
}

void HnswIndex::set_entry_locked() {
  entry_ = kNoSlot;
  max_level_ = -1;
  for (const auto& n : nodes_) {
    if (n && n->level > max_level_) {
      entry_ = n->slot;
      max_level_ = n->level;
    }
  }
}

void HnswIndex::compact(const std::vector<Slot>& remap) {
  std::unique_lock<std::shared_mutex> lock(graph_mutex_);
  const auto view = store_.read();

  auto mapped = [&remap](Slot old) { return old < remap.size() ? remap[old] : kNoSlot; };

  std::vector<std::unique_ptr<Node>> fresh(view.slot_count());
  std::size_t count = 0;

  for (const auto& old : nodes_) {
    if (!old) {
      continue;
    }
    const Slot target = mapped(old->slot);
    if (target == kNoSlot) {
      continue;
    }
    if (target >= fresh.size()) {
      throw IndexCorruptionDetected("compaction remap points past the record store");
    }

    auto node = std::make_unique<Node>(target, old->level);
    for (int level = 0; level <= old->level; ++level) {
      const auto& links = old->links[static_cast<std::size_t>(level)];

      std::vector<Candidate> kept;
      std::vector<Slot> extras;
      bool lost = false;
      for (const Neighbor& nb : links) {
        const Slot m = mapped(nb.slot);
        if (m != kNoSlot) {
          kept.push_back(Candidate{nb.distance, m});
          continue;
        }
        lost = true;
        const Node* removed = node_at(nb.slot);
        if (!removed || removed->level < level) {
          continue;
        }
        for (const Neighbor& second : removed->links[static_cast<std::size_t>(level)]) {
          const Slot m2 = mapped(second.slot);
          if (m2 != kNoSlot && m2 != target) {
            extras.push_back(m2);
          }
        }
      }

      auto& out = node->links[static_cast<std::size_t>(level)];
      if (!lost) {
        out.reserve(kept.size());
        for (const Candidate& c : kept) {
          out.push_back(Neighbor{c.slot, c.distance});
        }
        continue;
      }

      std::unordered_set<Slot> seen;
      std::vector<Candidate> pool;
      for (const Candidate& c : kept) {
        if (seen.insert(c.slot).second) {
          pool.push_back(c);
        }
      }
      for (const Slot e : extras) {
        if (seen.insert(e).second) {
          pool.push_back(Candidate{view.distance(target, e), e});
        }
      }
      std::sort(pool.begin(), pool.end(), CloserFirst{});
      out = select_neighbors(view, pool, max_links(level), level == 0);
    }

    fresh[target] = std::move(node);
    ++count;
  }

  nodes_ = std::move(fresh);
  node_count_ = count;
  set_entry_locked();
}

void HnswIndex::verify() const {
  std::shared_lock<std::shared_mutex> lock(graph_mutex_);
  const auto view = store_.read();

  std::size_t count = 0;
  for (std::size_t s = 0; s < nodes_.size(); ++s) {
    const Node* n = nodes_[s].get();
    if (!n) {
      continue;
    }
    ++count;
    if (n->slot != s) {
      throw IndexCorruptionDetected("node stored at slot " + std::to_string(s) + " claims slot " +
                                    std::to_string(n->slot));
    }
    if (!view.valid(n->slot)) {
      throw IndexCorruptionDetected("node " + std::to_string(s) + " has no record row");
    }
    for (int level = 0; level <= n->level; ++level) {
      const auto links = copy_links(*n, level);
      if (links.size() > max_links(level)) {
        throw IndexCorruptionDetected("node " + std::to_string(s) + " exceeds the link limit at layer " +
                                      std::to_string(level));
      }
      for (const Neighbor& nb : links) {
        const Node* target = node_at(nb.slot);
        if (!target) {
          throw IndexCorruptionDetected("node " + std::to_string(s) + " links to missing node " +
                                        std::to_string(nb.slot) + " at layer " + std::to_string(level));
        }
        if (nb.slot == s) {
          throw IndexCorruptionDetected("node " + std::to_string(s) + " links to itself");
        }
        if (target->level < level) {
          throw IndexCorruptionDetected("node " + std::to_string(s) + " links above the level of node " +
                                        std::to_string(nb.slot));
        }
      }
    }
  }

  if (count != node_count_) {
    throw IndexCorruptionDetected("node count mismatch");
  }
  if (count == 0) {
    if (entry_ != kNoSlot) {
      throw IndexCorruptionDetected("empty graph has an entry point");
    }
    return;
  }
  const Node* entry = node_at(entry_);
  if (!entry || entry->level != max_level_) {
    throw IndexCorruptionDetected("entry point is missing or not on the top layer");
  }
}

std::vector<GraphNode> HnswIndex::export_graph() const {
  std::shared_lock<std::shared_mutex> lock(graph_mutex_);
  const auto view = store_.read();

  std::vector<GraphNode> out;
  out.reserve(node_count_);
  for (const auto& n : nodes_) {
    if (!n || !view.is_live(n->slot)) {
      continue;
    }
    GraphNode g;
    g.record_id = view.id(n->slot);
    g.level = n->level;
    g.neighbors.resize(static_cast<std::size_t>(n->level) + 1);
    for (int level = 0; level <= n->level; ++level) {
      for (const Neighbor& nb : copy_links(*n, level)) {
        if (view.is_live(nb.slot)) {
          g.neighbors[static_cast<std::size_t>(level)].emplace_back(view.id(nb.slot), nb.distance);
        }
      }
    }
    out.push_back(std::move(g));
  }
  return out;
}

std::vector<std::string> HnswIndex::import_graph(const std::vector<GraphNode>& nodes) {
  std::unique_lock<std::shared_mutex> lock(graph_mutex_);
  const auto view = store_.read();

  std::vector<std::string> problems;
  nodes_.clear();
  nodes_.resize(view.slot_count());
  node_count_ = 0;

  std::vector<Slot> slots(nodes.size(), kNoSlot);
  for (std::size_t i = 0; i < nodes.size(); ++i) {
    const GraphNode& g = nodes[i];
    const Slot s = view.find(g.record_id);
    if (s == kNoSlot) {
      problems.push_back("graph node for unknown record '" + g.record_id + "'");
      continue;
    }
    if (nodes_[s]) {
      problems.push_back("duplicate graph node for record '" + g.record_id + "'");
      continue;
    }
    if (g.level < 0 || g.level > kMaxLevel) {
      problems.push_back("graph node '" + g.record_id + "' has invalid level " + std::to_string(g.level));
      continue;
    }
    nodes_[s] = std::make_unique<Node>(s, g.level);
    slots[i] = s;
    ++node_count_;
  }

  for (std::size_t i = 0; i < nodes.size(); ++i) {
    if (slots[i] == kNoSlot) {
      continue;
    }
    const GraphNode& g = nodes[i];
    Node& node = *nodes_[slots[i]];
    const std::size_t layers = std::min(g.neighbors.size(), node.links.size());
    for (std::size_t level = 0; level < layers; ++level) {
      auto& out = node.links[level];
      for (const auto& [id, dist] : g.neighbors[level]) {
        const Slot t = view.find(id);
        if (t == kNoSlot || !nodes_[t] || t == node.slot) {
          problems.push_back("record '" + g.record_id + "' references missing neighbor '" + id + "' at layer " +
                             std::to_string(level));
          continue;
        }
        if (nodes_[t]->level < static_cast<int>(level)) {
          problems.push_back("record '" + g.record_id + "' links to '" + id + "' above its level");
          continue;
        }
        if (out.size() >= max_links(static_cast<int>(level))) {
          problems.push_back("record '" + g.record_id + "' exceeds the link limit at layer " +
                             std::to_string(level));
          break;
        }
        out.push_back(Neighbor{t, dist});
      }
    }
  }

  set_entry_locked();
  return problems;
}

} // namespace vecsearch
