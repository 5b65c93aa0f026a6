#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "vecsearch/types.h"

namespace vecsearch {

enum class EmbedMode : std::uint8_t { QUERY, DOCUMENT };

// Embedder
// --------
// Turns text into vectors of a fixed dimension. Model-backed embedders live
// outside this library; it only consumes this interface.
class Embedder {
public:
  virtual ~Embedder() = default;

  virtual std::size_t dimension() const = 0;
  virtual Vector embed(const std::string& text, EmbedMode mode) = 0;

  virtual std::vector<Vector> embed_batch(const std::vector<std::string>& texts, EmbedMode mode);
};

// Memoizes another embedder. Least recently used texts are dropped once
// `capacity` is reached. Thread-safe if the wrapped embedder is.
class CachedEmbedder : public Embedder {
public:
  CachedEmbedder(std::shared_ptr<Embedder> inner, std::size_t capacity = 256);

  std::size_t dimension() const override { return inner_->dimension(); }
  Vector embed(const std::string& text, EmbedMode mode) override;

  std::size_t size() const;
  std::size_t hits() const;
  std::size_t misses() const;

private:
  using Key = std::pair<EmbedMode, std::string>;
  struct KeyHash {
    std::size_t operator()(const Key& k) const noexcept {
      return std::hash<std::string>{}(k.second) ^ (static_cast<std::size_t>(k.first) + 0x9e3779b9u);
    }
  };
  using Lru = std::list<std::pair<Key, Vector>>;

  std::shared_ptr<Embedder> inner_;
  std::size_t capacity_;

  mutable std::mutex mutex_;
  Lru lru_; // front = most recent
  std::unordered_map<Key, Lru::iterator, KeyHash> index_;
  std::size_t hits_ = 0;
  std::size_t misses_ = 0;
};

// Feature hashing: each token adds +-1 to one of `dim` buckets, then the
// vector is L2-normalized. Deterministic and dependency-free; meant for demos
// and tests, not retrieval quality.
class HashingEmbedder : public Embedder {
public:
  explicit HashingEmbedder(std::size_t dim);

  std::size_t dimension() const override { return dim_; }
  Vector embed(const std::string& text, EmbedMode mode) override;

private:
  std::size_t dim_;
};

} // namespace vecsearch
