#include "vecsearch/embedder.h"

#include <stdexcept>

#include "vecsearch/distance.h"
#include "vecsearch/errors.h"
#include "vecsearch/text.h"

namespace vecsearch {

std::vector<Vector> Embedder::embed_batch(const std::vector<std::string>& texts, EmbedMode mode) {
  std::vector<Vector> out;
  out.reserve(texts.size());
  for (const auto& t : texts) {
    out.push_back(embed(t, mode));
  }
  return out;
}

CachedEmbedder::CachedEmbedder(std::shared_ptr<Embedder> inner, std::size_t capacity)
    : inner_(std::move(inner)), capacity_(capacity) {
  if (!inner_) {
    throw std::invalid_argument("CachedEmbedder needs an inner embedder");
  }
  if (capacity_ == 0) {
    throw InvalidParameter("CachedEmbedder capacity must be > 0");
  }
}

Vector CachedEmbedder::embed(const std::string& text, EmbedMode mode) {
  Key key{mode, text};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = index_.find(key);
    if (it != index_.end()) {
      lru_.splice(lru_.begin(), lru_, it->second);
      ++hits_;
      return it->second->second;
    }
    ++misses_;
  }

  // Not under the lock: the inner call may be slow.
  Vector v = inner_->embed(text, mode);

  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = index_.find(key);
  if (it != index_.end()) {
    lru_.erase(it->second);
    index_.erase(it);
  } else if (lru_.size() >= capacity_) {
    index_.erase(lru_.back().first);
    lru_.pop_back();
  }
  lru_.emplace_front(key, v);
  index_.emplace(std::move(key), lru_.begin());
  return v;
}

std::size_t CachedEmbedder::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lru_.size();
}

std::size_t CachedEmbedder::hits() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return hits_;
}

std::size_t CachedEmbedder::misses() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return misses_;
}

HashingEmbedder::HashingEmbedder(std::size_t dim) : dim_(dim) {
  if (dim_ == 0) {
    throw InvalidParameter("HashingEmbedder dim must be > 0");
  }
}

Vector HashingEmbedder::embed(const std::string& text, EmbedMode /*mode*/) {
  Vector v(dim_, 0.0f);
  for (const auto& token : tokenize(text)) {
    // FNV-1a
    std::uint64_t h = 1469598103934665603ull;
    for (const char c : token) {
      h ^= static_cast<unsigned char>(c);
      h *= 1099511628211ull;
    }
    const float sign = (h >> 63) ? -1.0f : 1.0f;
    v[static_cast<std::size_t>(h % dim_)] += sign;
  }
  normalize(v.data(), v.size());
  return v;
}

} // namespace vecsearch
