#include "vecsearch/reranker.h"

#include <algorithm>
#include <thread>
#include <unordered_set>
#include <utility>

#include "vecsearch/distance.h"
#include "vecsearch/errors.h"
#include "vecsearch/text.h"

namespace vecsearch {

void rank_hits(std::vector<SearchHit>& hits) {
  std::sort(hits.begin(), hits.end(), [](const SearchHit& a, const SearchHit& b) {
    return a.score > b.score || (a.score == b.score && a.id < b.id);
  });
  for (std::size_t i = 0; i < hits.size(); ++i) {
    hits[i].rank = i + 1;
  }
}

VectorCosineReranker::VectorCosineReranker(std::chrono::microseconds per_candidate)
    : per_candidate_(per_candidate) {}

std::chrono::microseconds VectorCosineReranker::estimated_cost(std::size_t candidates) const {
  return per_candidate_ * static_cast<std::int64_t>(candidates);
}

std::vector<SearchHit> VectorCosineReranker::rerank(const RerankQuery& query, std::vector<SearchHit> hits) const {
  if (!query.lookup) {
    throw std::invalid_argument("VectorCosineReranker needs a vector lookup");
  }
  const std::size_t dim = query.vector.size();
  const float qn = l2_norm(query.vector.data(), dim);

  std::vector<SearchHit> out;
  out.reserve(hits.size());
  for (auto& hit : hits) {
    const auto v = query.lookup(hit.id);
    if (!v) {
      continue;
    }
    if (v->size() != dim) {
      throw DimensionMismatch(dim, v->size());
    }
    const float d = distance(Metric::COSINE, query.vector.data(), qn, v->data(), l2_norm(v->data(), dim), dim);
    hit.baseline_score = hit.score;
    hit.score = score_from_distance(Metric::COSINE, d);
    hit.score_source = name();
    out.push_back(std::move(hit));
  }
  rank_hits(out);
  return out;
}

TokenOverlapReranker::TokenOverlapReranker() : TokenOverlapReranker(Options{}) {}

TokenOverlapReranker::TokenOverlapReranker(Options options) : options_(std::move(options)) {}

std::chrono::microseconds TokenOverlapReranker::estimated_cost(std::size_t candidates) const {
  return options_.latency + options_.per_candidate * static_cast<std::int64_t>(candidates);
}

std::size_t TokenOverlapReranker::count_phrase(const std::vector<std::string>& query_tokens,
                                               const std::vector<std::string>& doc_tokens) {
  const std::size_t window = query_tokens.size();
  if (window < 2 || doc_tokens.size() < window) {
    return 0;
  }
  std::size_t hits = 0;
  for (std::size_t i = 0; i + window <= doc_tokens.size(); ++i) {
    if (std::equal(query_tokens.begin(), query_tokens.end(), doc_tokens.begin() + static_cast<std::ptrdiff_t>(i))) {
      ++hits;
    }
  }
  return hits;
}

std::vector<SearchHit> TokenOverlapReranker::rerank(const RerankQuery& query, std::vector<SearchHit> hits) const {
  if (hits.empty()) {
    return hits;
  }
  if (options_.latency.count() > 0) {
    std::this_thread::sleep_for(options_.latency);
  }

  const auto query_tokens = query.text ? tokenize(*query.text) : std::vector<std::string>{};
  const std::unordered_set<std::string> query_set(query_tokens.begin(), query_tokens.end());

  for (auto& hit : hits) {
    std::vector<std::string> doc_tokens;
    const auto it = hit.payload.find(options_.text_field);
    if (it != hit.payload.end()) {
      if (const auto* text = std::get_if<std::string>(&it->second)) {
        doc_tokens = tokenize(*text);
      }
    }

    const auto overlap = static_cast<std::int64_t>(
        std::count_if(doc_tokens.begin(), doc_tokens.end(), [&](const std::string& t) { return query_set.count(t) != 0; }));
    const auto phrase_hits = static_cast<std::int64_t>(count_phrase(query_tokens, doc_tokens));

    hit.baseline_score = hit.score;
    hit.score = options_.base_weight * hit.score + options_.overlap_weight * static_cast<float>(overlap) +
                options_.phrase_weight * static_cast<float>(phrase_hits);
    hit.score_source = name();
    hit.payload["rerank_overlap"] = overlap;
    hit.payload["rerank_phrase_hits"] = phrase_hits;
  }
  rank_hits(hits);
  return hits;
}

} // namespace vecsearch
