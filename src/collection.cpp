#include "vecsearch/collection.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <utility>

#include "vecsearch/distance.h"
#include "vecsearch/errors.h"
#include "vecsearch/logging.h"

namespace vecsearch {

namespace {

CollectionConfig validated(CollectionConfig config) {
  config.validate();
  return config;
}

double elapsed_ms(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

Collection::Collection(CollectionConfig config)
    : config_(validated(std::move(config))),
      store_(config_.dimension, config_.metric),
      exact_(store_),
      index_(std::make_unique<HnswIndex>(store_, config_.index, config_.seed)) {}

CollectionConfig Collection::config() const {
  std::shared_lock<std::shared_mutex> lock(maintenance_mutex_);
  return config_;
}

CollectionInfo Collection::info() const {
  std::shared_lock<std::shared_mutex> lock(maintenance_mutex_);

  CollectionInfo out;
  out.config = config_;
  out.live_records = store_.live_count();
  out.tombstoned_slots = store_.retired_count();
  out.tombstone_density = store_.tombstone_density();

  const GraphStats g = index_->stats();
  out.graph_nodes = g.nodes;
  out.graph_edges = g.edges;
  out.max_level = g.max_level;

  const Slot entry = index_->entry_point();
  if (entry != kNoSlot) {
    const auto view = store_.read();
    out.entry_point = view.id(entry);
  }

  {
    std::lock_guard<std::mutex> events_lock(events_mutex_);
    out.pending_index_events = events_.size();
  }
  out.tombstone_warnings = tombstone_warnings_.load();

  out.halted = halted();
  std::lock_guard<std::mutex> status_lock(status_mutex_);
  out.halt_reason = halt_reason_;
  return out;
}

void Collection::ensure_writable() const {
  if (!halted()) {
    return;
  }
  std::lock_guard<std::mutex> lock(status_mutex_);
  throw IndexCorruptionDetected("collection '" + config_.name + "' is halted (" + halt_reason_ +
                                "); run compact or rebuild_index");
}

void Collection::halt(const std::string& reason) {
  {
    std::lock_guard<std::mutex> lock(status_mutex_);
    halt_reason_ = reason;
  }
  halted_.store(true, std::memory_order_release);
  logger()->error("collection '{}' halted for writes: {}", config_.name, reason);
}

void Collection::clear_halt() {
  if (!halted_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(status_mutex_);
    halt_reason_.clear();
  }
  logger()->info("collection '{}' accepts writes again", config_.name);
}

void Collection::set_write_observer(WriteObserver observer) {
  std::lock_guard<std::mutex> lock(status_mutex_);
  observer_ = std::move(observer);
}

void Collection::enqueue(Slot slot) {
  std::lock_guard<std::mutex> lock(events_mutex_);
  events_.push_back(slot);
}

void Collection::drain_index_events() {
  for (;;) {
    Slot slot = kNoSlot;
    {
      std::lock_guard<std::mutex> lock(events_mutex_);
      if (events_.empty()) {
        return;
      }
      slot = events_.front();
      events_.pop_front();
    }
    index_->insert(slot);
  }
}

void Collection::after_write() {
  const double density = store_.tombstone_density();
  if (density > config_.tombstone_warn_ratio) {
    // Warn again each time the retired count doubles.
    const std::size_t retired = store_.retired_count();
    std::size_t threshold = next_tombstone_warning_.load();
    while (retired >= threshold) {
      if (next_tombstone_warning_.compare_exchange_weak(threshold, std::max<std::size_t>(retired * 2, 1))) {
        tombstone_warnings_.fetch_add(1);
        logger()->warn("collection '{}': {} retired slots ({:.0f}% of storage); search quality degrades until "
                       "compact()",
                       config_.name, retired, density * 100.0);
        break;
      }
    }
  }

  WriteObserver observer;
  {
    std::lock_guard<std::mutex> lock(status_mutex_);
    observer = observer_;
  }
  if (observer) {
    observer(config_.name);
  }
}

std::uint64_t Collection::upsert(const RecordId& id, const float* vec_data, std::size_t dim, Payload payload) {
  UpsertResult result;
  {
    std::shared_lock<std::shared_mutex> lock(maintenance_mutex_);
    ensure_writable();

    try {
      result = store_.upsert(id, vec_data, dim, payload, store_.version_of(id));
    } catch (const ConcurrentModificationConflict& e) {
      logger()->debug("collection '{}': {}; retrying once", config_.name, e.what());
      result = store_.upsert(id, vec_data, dim, std::move(payload), store_.version_of(id));
    }

    enqueue(result.slot);
    drain_index_events();
  }
  after_write();
  return result.version;
}

bool Collection::remove(const RecordId& id) {
  {
    std::shared_lock<std::shared_mutex> lock(maintenance_mutex_);
    ensure_writable();

    const auto slot = store_.remove(id);
    if (!slot) {
      return false;
    }
  }
  after_write();
  return true;
}

VectorRecord Collection::get(const RecordId& id) const {
  std::shared_lock<std::shared_mutex> lock(maintenance_mutex_);
  return store_.get(id);
}

std::optional<Vector> Collection::vector_of(const RecordId& id) const {
  std::shared_lock<std::shared_mutex> lock(maintenance_mutex_);
  auto rec = store_.lookup(id);
  if (!rec) {
    return std::nullopt;
  }
  return std::move(rec->vector);
}

RecordCursor Collection::scan(Filter filter) const { return store_.scan(std::move(filter)); }

std::vector<SearchHit> Collection::materialize(const RecordStore::ReadView& view, std::vector<Candidate> candidates,
                                               const char* source) const {
  // Equal distances resolve by record id.
  std::stable_sort(candidates.begin(), candidates.end(), [&view](const Candidate& a, const Candidate& b) {
    if (a.distance != b.distance) {
      return a.distance < b.distance;
    }
    return view.id(a.slot) < view.id(b.slot);
  });

  std::vector<SearchHit> hits;
  hits.reserve(candidates.size());
  for (const Candidate& c : candidates) {
    // Deleted between the graph walk and now.
    if (!view.is_live(c.slot)) {
      continue;
    }
    SearchHit hit;
    hit.id = view.id(c.slot);
    hit.score = score_from_distance(config_.metric, c.distance);
    hit.baseline_score = hit.score;
    hit.payload = view.payload(c.slot);
    hit.rank = hits.size() + 1;
    hit.score_source = source;
    hits.push_back(std::move(hit));
  }
  return hits;
}

CollectionSearchResult Collection::search(const float* query, std::size_t dim, const SearchOptions& options) const {
  if (dim != config_.dimension) {
    throw DimensionMismatch(config_.dimension, dim);
  }
  if (!query) {
    throw InvalidParameter("query pointer is null");
  }
  for (std::size_t i = 0; i < dim; ++i) {
    if (!std::isfinite(query[i])) {
      throw InvalidParameter("query component " + std::to_string(i) + " is not finite");
    }
  }
  if (options.top_k == 0) {
    throw InvalidParameter("top_k must be > 0");
  }

  std::shared_lock<std::shared_mutex> lock(maintenance_mutex_);

  CollectionSearchResult result;
  const std::size_t requested = options.ef_search.value_or(config_.index.ef_search);
  const std::size_t ceiling = std::max(config_.index.max_ef_search, options.top_k);
  if (requested < options.top_k) {
    result.ef_raised = true;
    logger()->warn("collection '{}': ef_search {} < top_k {}; raising to top_k", config_.name, requested,
                   options.top_k);
  }
  result.ef_used = std::clamp(requested, options.top_k, ceiling);

  if (store_.live_count() == 0) {
    result.stats.ef_used = result.ef_used;
    return result;
  }

  SlotPredicate accept;
  if (!options.filter.empty()) {
    accept = [&options](const RecordStore::ReadView& view, Slot s) {
      return options.filter.matches(view.payload(s));
    };
  }

  const bool exact = options.exact || store_.live_count() <= config_.brute_force_threshold || index_->size() == 0;
  if (exact) {
    const auto view = store_.read();
    auto candidates = exact_.search(view, query, options.top_k, accept, options.control, &result.stats);
    result.stats.ef_used = result.ef_used;
    result.hits = materialize(view, std::move(candidates), "exact");
    return result;
  }

  auto candidates =
      index_->search(query, options.top_k, result.ef_used, accept, options.control, &result.stats);
  const auto view = store_.read();
  result.hits = materialize(view, std::move(candidates), "ann");
  logger()->debug("collection '{}': ann search ef={} expanded={} evaluated={} recall_proxy={:.3f}", config_.name,
                  result.ef_used, result.stats.nodes_expanded, result.stats.distance_evaluations,
                  result.stats.recall_proxy());
  return result;
}

CompactionReport Collection::compact() {
  std::unique_lock<std::shared_mutex> lock(maintenance_mutex_);
  const auto start = std::chrono::steady_clock::now();

  drain_index_events();

  CompactionReport report;
  const std::vector<Slot> remap = store_.compact();
  index_->compact(remap);
  report.slots_reclaimed = static_cast<std::size_t>(
      std::count(remap.begin(), remap.end(), kNoSlot));
  report.live_records = store_.live_count();

  // Live rows that never got a node (for example after a halted restore).
  {
    std::vector<Slot> live;
    {
      const auto view = store_.read();
      for (std::size_t s = 0; s < view.slot_count(); ++s) {
        if (view.is_live(static_cast<Slot>(s))) {
          live.push_back(static_cast<Slot>(s));
        }
      }
    }
    for (const Slot s : live) {
      if (!index_->contains(s)) {
        index_->insert(s);
      }
    }
  }

  try {
    index_->verify();
  } catch (const IndexCorruptionDetected& e) {
    halt(e.what());
    throw;
  }
  clear_halt();
  next_tombstone_warning_.store(0);

  report.duration_ms = elapsed_ms(start);
  logger()->info("collection '{}' compacted: {} slots reclaimed, {} live, {:.2f} ms", config_.name,
                 report.slots_reclaimed, report.live_records, report.duration_ms);
  return report;
}

void Collection::rebuild_index(std::optional<IndexParams> params) {
  {
    std::unique_lock<std::shared_mutex> lock(maintenance_mutex_);
    const auto start = std::chrono::steady_clock::now();

    IndexParams next = params.value_or(config_.index);
    next.validate();

    {
      std::lock_guard<std::mutex> events_lock(events_mutex_);
      events_.clear();
    }

    auto fresh = std::make_unique<HnswIndex>(store_, next, config_.seed);
    std::vector<Slot> live;
    {
      const auto view = store_.read();
      live.reserve(view.live_count());
      for (std::size_t s = 0; s < view.slot_count(); ++s) {
        if (view.is_live(static_cast<Slot>(s))) {
          live.push_back(static_cast<Slot>(s));
        }
      }
    }
    for (const Slot s : live) {
      fresh->insert(s);
    }
    fresh->verify();

    index_ = std::move(fresh);
    config_.index = next;
    clear_halt();

    logger()->info("collection '{}' index rebuilt (M={}, ef_construction={}, ef_search={}): {} nodes, {:.2f} ms",
                   config_.name, next.M, next.ef_construction, next.ef_search, live.size(), elapsed_ms(start));
  }
  // Different parameters can change results.
  after_write();
}

CollectionSnapshot Collection::snapshot() const {
  std::unique_lock<std::shared_mutex> lock(maintenance_mutex_);

  CollectionSnapshot snap;
  snap.config = config_;
  {
    const auto view = store_.read();
    snap.records.reserve(view.live_count());
    for (std::size_t s = 0; s < view.slot_count(); ++s) {
      if (view.is_live(static_cast<Slot>(s))) {
        snap.records.push_back(view.record(static_cast<Slot>(s)));
      }
    }
  }
  snap.nodes = index_->export_graph();
  return snap;
}

std::unique_ptr<Collection> Collection::restore(const CollectionSnapshot& snapshot) {
  auto collection = std::make_unique<Collection>(snapshot.config);

  for (const VectorRecord& rec : snapshot.records) {
    collection->store_.restore(rec);
  }

  const std::vector<std::string> problems = collection->index_->import_graph(snapshot.nodes);
  if (!problems.empty()) {
    for (const auto& p : problems) {
      logger()->error("collection '{}' restore: {}", snapshot.config.name, p);
    }
    collection->halt(std::to_string(problems.size()) + " broken graph reference(s), first: " + problems.front());
    return collection;
  }

  // Records that were not yet linked when the snapshot was taken.
  std::vector<Slot> live;
  {
    const auto view = collection->store_.read();
    for (std::size_t s = 0; s < view.slot_count(); ++s) {
      if (view.is_live(static_cast<Slot>(s))) {
        live.push_back(static_cast<Slot>(s));
      }
    }
  }
  for (const Slot s : live) {
    if (!collection->index_->contains(s)) {
      collection->index_->insert(s);
    }
  }

  collection->verify_index();
  logger()->info("collection '{}' restored: {} records, {} graph nodes", snapshot.config.name,
                 snapshot.records.size(), snapshot.nodes.size());
  return collection;
}

void Collection::verify_index() {
  std::shared_lock<std::shared_mutex> lock(maintenance_mutex_);
  try {
    index_->verify();
  } catch (const IndexCorruptionDetected& e) {
    halt(e.what());
    throw;
  }
}

} // namespace vecsearch
