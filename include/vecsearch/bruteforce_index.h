#pragma once

#include <cstddef>
#include <vector>

#include "vecsearch/record_store.h"
#include "vecsearch/search_control.h"

namespace vecsearch {

// BruteForceIndex
// --------------
// Exact top-k over every row of a RecordStore. Used for tiny collections,
// where a graph walk costs more than a scan, and as ground truth when
// measuring graph recall.

class BruteForceIndex {
public:
  explicit BruteForceIndex(const RecordStore& store) : store_(store) {}

  // Results are sorted closest first. Rows rejected by `accept` are skipped;
  // an empty predicate accepts every live row.
  std::vector<Candidate> search(const RecordStore::ReadView& view, const float* query, std::size_t k,
                                const SlotPredicate& accept, const SearchControl& control = {},
                                SearchStats* stats = nullptr) const;

  // Convenience overload that takes its own read view.
  std::vector<Candidate> search(const float* query, std::size_t k, const SlotPredicate& accept = {}) const;

private:
  const RecordStore& store_;
};

} // namespace vecsearch
