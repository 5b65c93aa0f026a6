#include "vecsearch/collection_manager.h"

#include <mutex>
#include <utility>

#include "vecsearch/errors.h"
#include "vecsearch/logging.h"

namespace vecsearch {

CollectionManager::CollectionManager(std::shared_ptr<QueryCache> cache) : cache_(std::move(cache)) {}

void CollectionManager::attach(Collection& collection) {
  if (!cache_) {
    return;
  }
  std::weak_ptr<QueryCache> weak = cache_;
  collection.set_write_observer([weak](const std::string& name) {
    if (auto cache = weak.lock()) {
      cache->invalidate(name);
    }
  });
}

std::shared_ptr<Collection> CollectionManager::create(CollectionConfig config) {
  config.validate();

  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (collections_.count(config.name) != 0) {
    throw AlreadyExists("collection '" + config.name + "' already exists");
  }

  auto collection = std::make_shared<Collection>(config);
  attach(*collection);
  collections_.emplace(config.name, collection);

  logger()->info("created collection '{}' (dim={}, metric={}, M={}, ef_construction={}, ef_search={})", config.name,
                 config.dimension, metric_name(config.metric), config.index.M, config.index.ef_construction,
                 config.index.ef_search);
  return collection;
}

void CollectionManager::drop(const std::string& name) {
  std::shared_ptr<Collection> dropped;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const auto it = collections_.find(name);
    if (it == collections_.end()) {
      throw NotFound("collection '" + name + "' not found");
    }
    dropped = std::move(it->second);
    collections_.erase(it);

    // Inside the lock: a collection recreated under the same name must not
    // see entries of the dropped one.
    dropped->set_write_observer(nullptr);
    if (cache_) {
      cache_->invalidate(name);
    }
  }
  logger()->info("dropped collection '{}'", name);
}

CollectionInfo CollectionManager::describe(const std::string& name) const { return get(name)->info(); }

std::vector<std::string> CollectionManager::list() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(collections_.size());
  for (const auto& kv : collections_) {
    names.push_back(kv.first);
  }
  return names;
}

bool CollectionManager::contains(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return collections_.count(name) != 0;
}

std::shared_ptr<Collection> CollectionManager::get(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = collections_.find(name);
  if (it == collections_.end()) {
    throw NotFound("collection '" + name + "' not found");
  }
  return it->second;
}

void CollectionManager::rebuild(const std::string& name, std::optional<IndexParams> params) {
  get(name)->rebuild_index(std::move(params));
}

CompactionReport CollectionManager::compact(const std::string& name) { return get(name)->compact(); }

CollectionSnapshot CollectionManager::snapshot(const std::string& name) const { return get(name)->snapshot(); }

std::shared_ptr<Collection> CollectionManager::restore(const CollectionSnapshot& snapshot) {
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (collections_.count(snapshot.config.name) != 0) {
      throw AlreadyExists("collection '" + snapshot.config.name + "' already exists");
    }
  }

  // Built outside the lock; restoring a large collection takes a while.
  std::shared_ptr<Collection> collection = Collection::restore(snapshot);

  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (collections_.count(snapshot.config.name) != 0) {
    throw AlreadyExists("collection '" + snapshot.config.name + "' already exists");
  }
  attach(*collection);
  collections_.emplace(snapshot.config.name, collection);
  if (cache_) {
    cache_->invalidate(snapshot.config.name);
  }
  return collection;
}

} // namespace vecsearch
