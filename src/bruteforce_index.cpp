#include "vecsearch/bruteforce_index.h"

#include <algorithm>
#include <queue>
#include <stdexcept>

#include "vecsearch/distance.h"

namespace vecsearch {

std::vector<Candidate> BruteForceIndex::search(const RecordStore::ReadView& view, const float* query,
                                               std::size_t k, const SlotPredicate& accept,
                                               const SearchControl& control, SearchStats* stats) const {
  if (!query) {
    throw std::invalid_argument("query pointer is null");
  }
  if (k == 0) {
    return {};
  }

  SearchStats local;
  SearchStats& st = stats ? *stats : local;
  st.exact = true;

  const float query_norm = (view.metric() == Metric::COSINE) ? l2_norm(query, view.dim()) : 0.0f;

  // Max-heap of current best results. top() is the worst among the kept
  // candidates, which makes replacement O(log k).
  std::priority_queue<Candidate, std::vector<Candidate>, FartherOnTop> heap;

  const std::size_t n = view.slot_count();
  for (std::size_t i = 0; i < n; ++i) {
    // Polled every 256 rows.
    if ((i & 0xFF) == 0 && control.should_stop(st.cancelled, st.deadline_hit)) {
      break;
    }
    const auto s = static_cast<Slot>(i);
    if (!view.is_live(s)) {
      continue;
    }

    ++st.candidates_considered;
    if (accept && !accept(view, s)) {
      continue;
    }
    ++st.candidates_accepted;

    const Candidate c{view.distance(query, query_norm, s), s};
    ++st.distance_evaluations;

    if (heap.size() < k) {
      heap.push(c);
    } else if (CloserFirst{}(c, heap.top())) {
      heap.pop();
      heap.push(c);
    }
  }

  std::vector<Candidate> out;
  out.reserve(heap.size());
  while (!heap.empty()) {
    out.push_back(heap.top());
    heap.pop();
  }
  std::reverse(out.begin(), out.end());
  return out;
}

std::vector<Candidate> BruteForceIndex::search(const float* query, std::size_t k,
                                               const SlotPredicate& accept) const {
  const auto view = store_.read();
  return search(view, query, k, accept);
}

} // namespace vecsearch
