#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "vecsearch/types.h"

namespace vecsearch {

struct RerankQuery {
  std::optional<std::string> text;
  Vector vector;
  // Current vector of a record, or nullopt if it is gone.
  std::function<std::optional<Vector>(const RecordId&)> lookup;
};

// Reranker
// --------
// Second-stage scorer over the index's candidates. Implementations return
// the hits best first with rank, score and score_source rewritten; the score
// they received is kept in baseline_score.
class Reranker {
public:
  virtual ~Reranker() = default;

  virtual std::string name() const = 0;

  // Expected wall time for `candidates` hits; the orchestrator skips the
  // stage when less than this is left.
  virtual std::chrono::microseconds estimated_cost(std::size_t candidates) const = 0;

  virtual std::vector<SearchHit> rerank(const RerankQuery& query, std::vector<SearchHit> hits) const = 0;
};

// Re-scores by exact cosine similarity to the query vector. Hits whose
// record no longer exists are dropped.
class VectorCosineReranker : public Reranker {
public:
  explicit VectorCosineReranker(std::chrono::microseconds per_candidate = std::chrono::microseconds(2));

  std::string name() const override { return "vector_cosine"; }
  std::chrono::microseconds estimated_cost(std::size_t candidates) const override;
  std::vector<SearchHit> rerank(const RerankQuery& query, std::vector<SearchHit> hits) const override;

private:
  std::chrono::microseconds per_candidate_;
};

// Lexical stand-in for a cross-encoder:
//   score = base_weight * ann_score + overlap_weight * overlap
//           + phrase_weight * phrase_hits
// where overlap counts payload "text" tokens that occur in the query and
// phrase_hits counts occurrences of the whole query token sequence. The two
// counts are added to the hit payload as "rerank_overlap" and
// "rerank_phrase_hits".
class TokenOverlapReranker : public Reranker {
public:
  struct Options {
    float base_weight = 0.1f;
    float overlap_weight = 0.3f;
    float phrase_weight = 1.0f;
    std::string text_field = "text";
    // Fixed extra time per call; simulates a model round trip.
    std::chrono::microseconds latency{0};
    std::chrono::microseconds per_candidate{20};
  };

  TokenOverlapReranker();
  explicit TokenOverlapReranker(Options options);

  std::string name() const override { return "cross_encoder"; }
  std::chrono::microseconds estimated_cost(std::size_t candidates) const override;
  std::vector<SearchHit> rerank(const RerankQuery& query, std::vector<SearchHit> hits) const override;

  // Non-overlapping positions are not required: "a a a" contains "a a" twice.
  static std::size_t count_phrase(const std::vector<std::string>& query_tokens,
                                  const std::vector<std::string>& doc_tokens);

private:
  Options options_;
};

// Sorts best first (ties by id) and renumbers ranks from 1.
void rank_hits(std::vector<SearchHit>& hits);

} // namespace vecsearch
