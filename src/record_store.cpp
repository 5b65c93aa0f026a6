#include "vecsearch/record_store.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include "vecsearch/errors.h"

namespace vecsearch {

RecordStore::RecordStore(std::size_t dim, Metric metric) : dim_(dim), metric_(metric) {
  if (dim_ == 0) {
    throw InvalidParameter("RecordStore dim must be > 0");
  }
}

std::size_t RecordStore::live_count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return slots_.size() - retired_;
}

std::size_t RecordStore::slot_count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return slots_.size();
}

std::size_t RecordStore::retired_count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return retired_;
}

double RecordStore::tombstone_density() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (slots_.empty()) {
    return 0.0;
  }
  return static_cast<double>(retired_) / static_cast<double>(slots_.size());
}

std::uint64_t RecordStore::epoch() const noexcept {
  return epoch_.load(std::memory_order_acquire);
}

void RecordStore::validate_vector(const float* vec_data, std::size_t dim) const {
  if (dim != dim_) {
    throw DimensionMismatch(dim_, dim);
  }
  if (!vec_data) {
    throw InvalidParameter("vec_data pointer is null");
  }
  for (std::size_t i = 0; i < dim_; ++i) {
    if (!std::isfinite(vec_data[i])) {
      throw InvalidParameter("vector component " + std::to_string(i) + " is not finite");
    }
  }
}

Slot RecordStore::append_locked(const RecordId& id, const float* vec_data, float norm, Payload payload,
                                std::uint64_t version) {
  if (slots_.size() >= static_cast<std::size_t>(kNoSlot)) {
    throw std::length_error("RecordStore slot space exhausted");
  }

  // Reserve geometrically: every reallocation copies the whole flat array.
  const std::size_t next_size = slots_.size() + 1;
  if (data_.capacity() < next_size * dim_) {
    data_.reserve(std::max(next_size, slots_.size() * 2) * dim_);
  }

  const auto slot = static_cast<Slot>(slots_.size());
  data_.insert(data_.end(), vec_data, vec_data + dim_);
  norms_.push_back(norm);
  slots_.push_back(SlotMeta{id, std::move(payload), version, false});
  return slot;
}

UpsertResult RecordStore::upsert(const RecordId& id, const float* vec_data, std::size_t dim, Payload payload,
                                 std::optional<std::uint64_t> expected_version) {
  if (id.empty()) {
    throw InvalidParameter("record id must not be empty");
  }
  validate_vector(vec_data, dim);

  // Computed outside the lock; only the append is exclusive.
  const float norm = l2_norm(vec_data, dim_);

  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto it = ids_.find(id);
  const std::uint64_t current = (it == ids_.end()) ? 0 : it->second.version;
  if (expected_version && *expected_version != current) {
    throw ConcurrentModificationConflict("record '" + id + "' is at version " + std::to_string(current) +
                                         ", expected " + std::to_string(*expected_version));
  }

  UpsertResult result;
  result.version = current + 1;
  result.slot = append_locked(id, vec_data, norm, std::move(payload), result.version);

  if (it == ids_.end()) {
    ids_.emplace(id, Entry{result.slot, result.version, false});
    result.created = true;
    return result;
  }

  Entry& entry = it->second;
  if (!entry.deleted) {
    slots_[entry.slot].retired = true;
    ++retired_;
    result.retired = entry.slot;
  }
  result.created = entry.deleted;
  entry = Entry{result.slot, result.version, false};
  return result;
}

std::optional<Slot> RecordStore::remove(const RecordId& id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto it = ids_.find(id);
  if (it == ids_.end() || it->second.deleted) {
    return std::nullopt;
  }

  Entry& entry = it->second;
  entry.deleted = true;
  slots_[entry.slot].retired = true;
  ++retired_;
  return entry.slot;
}

VectorRecord RecordStore::record_locked(Slot s) const {
  const SlotMeta& meta = slots_[s];
  const float* v = data_.data() + (static_cast<std::size_t>(s) * dim_);

  VectorRecord rec;
  rec.id = meta.id;
  rec.vector.assign(v, v + dim_);
  rec.payload = meta.payload;
  rec.deleted = meta.retired;
  rec.version = meta.version;
  return rec;
}

VectorRecord RecordStore::get(const RecordId& id) const {
  auto rec = lookup(id, false);
  if (!rec) {
    throw NotFound("record '" + id + "' not found");
  }
  return std::move(*rec);
}

std::optional<VectorRecord> RecordStore::lookup(const RecordId& id, bool include_deleted) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  const auto it = ids_.find(id);
  if (it == ids_.end()) {
    return std::nullopt;
  }
  if (it->second.deleted && !include_deleted) {
    return std::nullopt;
  }
  VectorRecord rec = record_locked(it->second.slot);
  rec.deleted = it->second.deleted;
  return rec;
}

std::uint64_t RecordStore::version_of(const RecordId& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = ids_.find(id);
  return it == ids_.end() ? 0 : it->second.version;
}

RecordCursor RecordStore::scan(Filter filter) const {
  return RecordCursor(this, std::move(filter), epoch());
}

Slot RecordStore::restore(const VectorRecord& record) {
  if (record.id.empty()) {
    throw InvalidParameter("record id must not be empty");
  }
  validate_vector(record.vector.data(), record.vector.size());
  const float norm = l2_norm(record.vector.data(), dim_);

  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (ids_.count(record.id) != 0) {
    throw AlreadyExists("record '" + record.id + "' already present");
  }

  const Slot slot = append_locked(record.id, record.vector.data(), norm, record.payload, record.version);
  if (record.deleted) {
    slots_[slot].retired = true;
    ++retired_;
  }
  ids_.emplace(record.id, Entry{slot, record.version, record.deleted});
  return slot;
}

std::vector<Slot> RecordStore::compact() {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  std::vector<Slot> remap(slots_.size(), kNoSlot);

  AlignedFloats data;
  std::vector<float> norms;
  std::vector<SlotMeta> slots;
  data.reserve((slots_.size() - retired_) * dim_);
  norms.reserve(slots_.size() - retired_);
  slots.reserve(slots_.size() - retired_);

  for (std::size_t i = 0; i < slots_.size(); ++i) {
    if (slots_[i].retired) {
      continue;
    }
    remap[i] = static_cast<Slot>(slots.size());
    const float* v = data_.data() + (i * dim_);
    data.insert(data.end(), v, v + dim_);
    norms.push_back(norms_[i]);
    slots.push_back(std::move(slots_[i]));
  }

  // Deleted ids are forgotten; their version sequence starts over.
  for (auto it = ids_.begin(); it != ids_.end();) {
    if (it->second.deleted) {
      it = ids_.erase(it);
      continue;
    }
    it->second.slot = remap[it->second.slot];
    ++it;
  }

  data_ = std::move(data);
  norms_ = std::move(norms);
  slots_ = std::move(slots);
  retired_ = 0;
  epoch_.fetch_add(1, std::memory_order_acq_rel);
  return remap;
}

Slot RecordStore::ReadView::find(const RecordId& id) const {
  const auto it = store_->ids_.find(id);
  if (it == store_->ids_.end() || it->second.deleted) {
    return kNoSlot;
  }
  return it->second.slot;
}

VectorRecord RecordStore::ReadView::record(Slot s) const {
  return store_->record_locked(s);
}

std::optional<VectorRecord> RecordCursor::next() {
  std::shared_lock<std::shared_mutex> lock(store_->mutex_);

  if (store_->epoch_.load(std::memory_order_acquire) != epoch_) {
    return std::nullopt;
  }

  while (position_ < store_->slots_.size()) {
    const Slot s = position_++;
    const auto& meta = store_->slots_[s];
    if (meta.retired) {
      continue;
    }
    if (!filter_.empty() && !filter_.matches(meta.payload)) {
      continue;
    }
    return store_->record_locked(s);
  }
  return std::nullopt;
}

void RecordCursor::reset() noexcept {
  position_ = 0;
  epoch_ = store_->epoch();
}

} // namespace vecsearch
