#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace vecsearch {

using RecordId = std::string;
using Vector = std::vector<float>;

// Payload values are scalars or a list of strings (tags). An int64 and a
// double never compare equal, even for the same number.
using PayloadValue =
    std::variant<std::monostate, bool, std::int64_t, double, std::string, std::vector<std::string>>;

using Payload = std::map<std::string, PayloadValue>;

// Unambiguous, type-tagged encoding ("i:42", "s5:hello", ...).
std::string encode_payload_value(const PayloadValue& value);

struct VectorRecord {
  RecordId id;
  Vector vector;
  Payload payload;
  bool deleted = false;
  std::uint64_t version = 0;
};

// Filter
// ------
// Conjunction of conditions over payload fields. An empty filter matches
// everything. Conditions are kept in a canonical order so two filters built
// in a different order fingerprint the same.
class Filter {
public:
  Filter& equals(std::string key, PayloadValue value);
  Filter& one_of(std::string key, std::vector<PayloadValue> values);
  Filter& exists(std::string key);

  bool empty() const noexcept { return conditions_.empty(); }
  std::size_t size() const noexcept { return conditions_.size(); }

  bool matches(const Payload& payload) const;

  std::string canonical() const;

private:
  enum class Op : std::uint8_t { EQUALS, ONE_OF, EXISTS };

  struct Condition {
    std::string key;
    Op op;
    std::vector<PayloadValue> values;
  };

  void add(Condition c);

  std::vector<Condition> conditions_;
};

struct SearchHit {
  RecordId id;
  float score = 0.0f;
  Payload payload;
  std::size_t rank = 0; // 1-based

  // ANN (or exact) score before any reranking.
  float baseline_score = 0.0f;

  // "ann", "exact", or the reranker name.
  std::string score_source;
};

} // namespace vecsearch
