#pragma once

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "vecsearch/collection.h"
#include "vecsearch/config.h"
#include "vecsearch/query_cache.h"

namespace vecsearch {

// CollectionManager
// -----------------
// Owns the named collections. Every collection it creates reports its writes
// to the shared QueryCache, which drops that collection's entries.
//
// Handles are shared_ptr: a search holding one finishes normally even if the
// collection is dropped meanwhile.
class CollectionManager {
public:
  explicit CollectionManager(std::shared_ptr<QueryCache> cache = nullptr);

  CollectionManager(const CollectionManager&) = delete;
  CollectionManager& operator=(const CollectionManager&) = delete;

  // Throws AlreadyExists if the name is taken, InvalidParameter on a bad
  // config.
  std::shared_ptr<Collection> create(CollectionConfig config);

  // Removes the collection and its cache entries. Throws NotFound.
  void drop(const std::string& name);

  CollectionInfo describe(const std::string& name) const;

  // Sorted by name.
  std::vector<std::string> list() const;

  bool contains(const std::string& name) const;

  // Throws NotFound.
  std::shared_ptr<Collection> get(const std::string& name) const;

  // Changing M or ef_construction only takes effect through this call.
  void rebuild(const std::string& name, std::optional<IndexParams> params = std::nullopt);

  CompactionReport compact(const std::string& name);

  CollectionSnapshot snapshot(const std::string& name) const;

  // Throws AlreadyExists if the snapshot's name is taken. The result may be
  // halted (see Collection::restore).
  std::shared_ptr<Collection> restore(const CollectionSnapshot& snapshot);

private:
  void attach(Collection& collection);

  std::shared_ptr<QueryCache> cache_;

  mutable std::shared_mutex mutex_;
  std::map<std::string, std::shared_ptr<Collection>> collections_;
};

} // namespace vecsearch
