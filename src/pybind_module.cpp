#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "vecsearch/embedder.h"
#include "vecsearch/engine.h"
#include "vecsearch/errors.h"
#include "vecsearch/reranker.h"

namespace py = pybind11;

namespace {

// Validates a NumPy vector and reads it in place through the buffer protocol.
// Non-float32 or strided input is rejected instead of silently converted.
const float* require_1d_float32_contiguous(const py::array& arr, std::size_t& dim_out) {
  py::buffer_info buf = arr.request();

  if (buf.ndim != 1) {
    throw std::invalid_argument("Expected a 1D NumPy array of shape (dim,)");
  }
  // itemsize alone is not enough; int32 is also 4 bytes.
  if (buf.itemsize != sizeof(float) || buf.format != py::format_descriptor<float>::format()) {
    throw std::invalid_argument("Expected dtype float32");
  }
  if (buf.shape[0] > 1 && buf.strides[0] != static_cast<py::ssize_t>(sizeof(float))) {
    throw std::invalid_argument("Expected contiguous float32 array (no slicing)");
  }

  dim_out = static_cast<std::size_t>(buf.shape[0]);
  return static_cast<const float*>(buf.ptr);
}

vecsearch::Vector to_vector(const py::array& arr) {
  std::size_t dim = 0;
  const float* ptr = require_1d_float32_contiguous(arr, dim);
  return vecsearch::Vector(ptr, ptr + dim);
}

vecsearch::PayloadValue to_payload_value(const py::handle& obj) {
  if (obj.is_none()) {
    return std::monostate{};
  }
  // bool before int: Python bools are ints.
  if (py::isinstance<py::bool_>(obj)) {
    return obj.cast<bool>();
  }
  if (py::isinstance<py::int_>(obj)) {
    return obj.cast<std::int64_t>();
  }
  if (py::isinstance<py::float_>(obj)) {
    return obj.cast<double>();
  }
  if (py::isinstance<py::str>(obj)) {
    return obj.cast<std::string>();
  }
  if (py::isinstance<py::list>(obj) || py::isinstance<py::tuple>(obj)) {
    std::vector<std::string> tags;
    for (const auto& item : obj) {
      if (!py::isinstance<py::str>(item)) {
        throw std::invalid_argument("payload lists may only hold strings");
      }
      tags.push_back(item.cast<std::string>());
    }
    return tags;
  }
  throw std::invalid_argument("unsupported payload value type: " +
                              std::string(py::str(obj.get_type().attr("__name__"))));
}

vecsearch::Payload to_payload(const py::object& obj) {
  vecsearch::Payload payload;
  if (obj.is_none()) {
    return payload;
  }
  for (const auto& item : obj.cast<py::dict>()) {
    payload[item.first.cast<std::string>()] = to_payload_value(item.second);
  }
  return payload;
}

py::object from_payload_value(const vecsearch::PayloadValue& value) {
  return std::visit(
      [](const auto& v) -> py::object {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return py::none();
        } else {
          return py::cast(v);
        }
      },
      value);
}

py::dict from_payload(const vecsearch::Payload& payload) {
  py::dict out;
  for (const auto& kv : payload) {
    out[py::str(kv.first)] = from_payload_value(kv.second);
  }
  return out;
}

// {"field": value} is an equality test; {"field": [a, b]} is one-of.
vecsearch::Filter to_filter(const py::object& obj) {
  vecsearch::Filter filter;
  if (obj.is_none()) {
    return filter;
  }
  for (const auto& item : obj.cast<py::dict>()) {
    const auto key = item.first.cast<std::string>();
    if (py::isinstance<py::list>(item.second) || py::isinstance<py::tuple>(item.second)) {
      std::vector<vecsearch::PayloadValue> values;
      for (const auto& v : item.second) {
        values.push_back(to_payload_value(v));
      }
      filter.one_of(key, std::move(values));
    } else {
      filter.equals(key, to_payload_value(item.second));
    }
  }
  return filter;
}

py::list from_hits(const std::vector<vecsearch::SearchHit>& hits) {
  py::list out;
  for (const auto& h : hits) {
    py::dict d;
    d["id"] = h.id;
    d["score"] = h.score;
    d["rank"] = h.rank;
    d["baseline_score"] = h.baseline_score;
    d["score_source"] = h.score_source;
    d["payload"] = from_payload(h.payload);
    out.append(d);
  }
  return out;
}

py::dict from_info(const vecsearch::CollectionInfo& info) {
  py::dict d;
  d["name"] = info.config.name;
  d["dimension"] = info.config.dimension;
  d["metric"] = vecsearch::metric_name(info.config.metric);
  d["M"] = info.config.index.M;
  d["ef_construction"] = info.config.index.ef_construction;
  d["ef_search"] = info.config.index.ef_search;
  d["rerank_enabled"] = info.config.rerank_enabled;
  d["live_records"] = info.live_records;
  d["tombstoned_slots"] = info.tombstoned_slots;
  d["tombstone_density"] = info.tombstone_density;
  d["tombstone_warnings"] = info.tombstone_warnings;
  d["graph_nodes"] = info.graph_nodes;
  d["graph_edges"] = info.graph_edges;
  d["max_level"] = info.max_level;
  d["entry_point"] = info.entry_point ? py::cast(*info.entry_point) : py::object(py::none());
  d["halted"] = info.halted;
  d["halt_reason"] = info.halt_reason;
  return d;
}

py::dict from_latency(const vecsearch::LatencySummary& s) {
  py::dict d;
  d["samples"] = s.samples;
  d["p50_ms"] = s.p50_ms;
  d["p95_ms"] = s.p95_ms;
  d["p99_ms"] = s.p99_ms;
  d["mean_ms"] = s.mean_ms;
  return d;
}

} // namespace

PYBIND11_MODULE(vecsearch, m) {
  m.doc() = "vecsearch: HNSW collections with a latency-bounded query pipeline (C++17 + pybind11)";
  m.attr("__version__") = VECSEARCH_VERSION;

  py::register_exception<vecsearch::DimensionMismatch>(m, "DimensionMismatch", PyExc_ValueError);
  py::register_exception<vecsearch::InvalidParameter>(m, "InvalidParameter", PyExc_ValueError);
  py::register_exception<vecsearch::NotFound>(m, "NotFound", PyExc_KeyError);
  py::register_exception<vecsearch::AlreadyExists>(m, "AlreadyExists", PyExc_RuntimeError);
  py::register_exception<vecsearch::DeadlineExceeded>(m, "DeadlineExceeded", PyExc_TimeoutError);
  py::register_exception<vecsearch::ConcurrentModificationConflict>(m, "ConcurrentModificationConflict",
                                                                     PyExc_RuntimeError);
  py::register_exception<vecsearch::IndexCorruptionDetected>(m, "IndexCorruptionDetected", PyExc_RuntimeError);

  py::class_<vecsearch::Engine>(m, "Engine")
      .def(py::init([](bool from_env) {
             return std::make_unique<vecsearch::Engine>(from_env ? vecsearch::EngineConfig::from_env()
                                                                 : vecsearch::EngineConfig());
           }),
           py::arg("from_env") = true)

      .def(
          "create_collection",
          [](vecsearch::Engine& self, const std::string& name, std::size_t dim, const std::string& metric,
             std::size_t M, std::size_t ef_construction, std::size_t ef_search, bool rerank) {
            vecsearch::IndexParams params;
            params.M = M;
            params.ef_construction = ef_construction;
            params.ef_search = ef_search;
            return from_info(
                self.create_collection(name, dim, vecsearch::parse_metric(metric), params, rerank));
          },
          py::arg("name"), py::arg("dim"), py::arg("metric") = "cosine", py::arg("M") = vecsearch::config::kDefaultM,
          py::arg("ef_construction") = vecsearch::config::kDefaultEfConstruction,
          py::arg("ef_search") = vecsearch::config::kDefaultEfSearch, py::arg("rerank") = false)
      .def("drop_collection", &vecsearch::Engine::drop_collection, py::arg("name"))
      .def("list_collections", &vecsearch::Engine::list_collections)
      .def(
          "describe", [](const vecsearch::Engine& self, const std::string& name) { return from_info(self.describe(name)); },
          py::arg("name"))

      // engine.upsert("docs", "a", np.ndarray[float32, (dim,)], {"lang": "en"})
      .def(
          "upsert",
          [](vecsearch::Engine& self, const std::string& collection, const std::string& id, const py::array& vec,
             const py::object& payload) {
            std::size_t dim = 0;
            const float* ptr = require_1d_float32_contiguous(vec, dim);
            return self.upsert(collection, id, ptr, dim, to_payload(payload));
          },
          py::arg("collection"), py::arg("id"), py::arg("vec"), py::arg("payload") = py::none(),
          "Insert or replace a record. Returns its new version.")
      .def("remove", &vecsearch::Engine::remove, py::arg("collection"), py::arg("id"))
      .def(
          "get",
          [](const vecsearch::Engine& self, const std::string& collection, const std::string& id) {
            const auto rec = self.get(collection, id);
            py::dict d;
            d["id"] = rec.id;
            d["vector"] = py::array_t<float>(static_cast<py::ssize_t>(rec.vector.size()), rec.vector.data());
            d["payload"] = from_payload(rec.payload);
            d["version"] = rec.version;
            return d;
          },
          py::arg("collection"), py::arg("id"))

      .def(
          "search",
          [](vecsearch::Engine& self, const std::string& collection, const py::object& vector,
             const std::optional<std::string>& text, std::size_t top_k, const py::object& filter,
             std::optional<std::size_t> ef_search, bool allow_rerank, std::optional<double> deadline_ms) {
            vecsearch::SearchRequest req;
            req.collection = collection;
            if (!vector.is_none()) {
              req.vector = to_vector(vector.cast<py::array>());
            }
            req.text = text;
            req.top_k = top_k;
            req.filter = to_filter(filter);
            req.ef_search = ef_search;
            req.allow_rerank = allow_rerank;
            if (deadline_ms) {
              req.deadline = std::chrono::milliseconds(static_cast<std::int64_t>(*deadline_ms));
            }

            vecsearch::SearchResponse resp;
            {
              py::gil_scoped_release release;
              resp = self.search(req);
            }

            py::dict d;
            d["hits"] = from_hits(resp.hits);
            d["cache_hit"] = resp.cache_hit;
            d["reranked"] = resp.reranked;
            d["unrefined"] = resp.unrefined;
            d["budget_exceeded"] = resp.budget_exceeded;
            d["cancelled"] = resp.cancelled;
            d["ef_raised"] = resp.ef_raised;
            d["ef_used"] = resp.ef_used;
            d["recall_proxy"] = resp.recall_proxy;
            d["total_ms"] = resp.total_ms;
            d["final_stage"] = vecsearch::stage_name(resp.final_stage);
            return d;
          },
          py::arg("collection"), py::arg("vector") = py::none(), py::arg("text") = py::none(), py::arg("top_k") = 10,
          py::arg("filter") = py::none(), py::arg("ef_search") = py::none(), py::arg("allow_rerank") = true,
          py::arg("deadline_ms") = py::none())

      .def(
          "compact",
          [](vecsearch::Engine& self, const std::string& collection) {
            const auto report = self.compact(collection);
            py::dict d;
            d["slots_reclaimed"] = report.slots_reclaimed;
            d["live_records"] = report.live_records;
            d["duration_ms"] = report.duration_ms;
            return d;
          },
          py::arg("collection"))
      // Unset parameters keep the collection's current values.
      .def(
          "rebuild_index",
          [](vecsearch::Engine& self, const std::string& collection, std::optional<std::size_t> M,
             std::optional<std::size_t> ef_construction, std::optional<std::size_t> ef_search) {
            if (!M && !ef_construction && !ef_search) {
              self.rebuild_index(collection);
              return;
            }
            vecsearch::IndexParams params = self.describe(collection).config.index;
            params.M = M.value_or(params.M);
            params.ef_construction = ef_construction.value_or(params.ef_construction);
            params.ef_search = ef_search.value_or(params.ef_search);
            self.rebuild_index(collection, params);
          },
          py::arg("collection"), py::arg("M") = py::none(), py::arg("ef_construction") = py::none(),
          py::arg("ef_search") = py::none())

      .def(
          "use_hashing_embedder",
          [](vecsearch::Engine& self, std::size_t dim, std::size_t cache_capacity) {
            auto inner = std::make_shared<vecsearch::HashingEmbedder>(dim);
            self.set_embedder(std::make_shared<vecsearch::CachedEmbedder>(inner, cache_capacity));
          },
          py::arg("dim"), py::arg("cache_capacity") = 256)
      .def(
          "use_reranker",
          [](vecsearch::Engine& self, const std::string& kind) {
            if (kind == "cross_encoder") {
              self.set_reranker(std::make_shared<vecsearch::TokenOverlapReranker>());
            } else if (kind == "vector_cosine") {
              self.set_reranker(std::make_shared<vecsearch::VectorCosineReranker>());
            } else {
              throw vecsearch::InvalidParameter("Unknown reranker: " + kind);
            }
          },
          py::arg("kind"))

      .def("metrics",
           [](const vecsearch::Engine& self) {
             const auto s = self.metrics();
             py::dict d;
             d["total"] = from_latency(s.total);
             d["embed"] = from_latency(s.embed);
             d["cache_probe"] = from_latency(s.cache_probe);
             d["index_search"] = from_latency(s.index_search);
             d["rerank"] = from_latency(s.rerank);
             d["queries"] = s.queries;
             d["cache_hits"] = s.cache_hits;
             d["cache_misses"] = s.cache_misses;
             d["reranked"] = s.reranked;
             d["rerank_skipped"] = s.rerank_skipped;
             d["degraded"] = s.degraded;
             d["cancelled"] = s.cancelled;
             d["deadline_failures"] = s.deadline_failures;
             d["mean_recall_proxy"] = s.mean_recall_proxy;
             d["compactions"] = s.compactions;
             return d;
           })
      .def("cache_stats", [](const vecsearch::Engine& self) {
        const auto s = self.cache_stats();
        py::dict d;
        d["hits"] = s.hits;
        d["misses"] = s.misses;
        d["insertions"] = s.insertions;
        d["evictions"] = s.evictions;
        d["expirations"] = s.expirations;
        d["invalidations"] = s.invalidations;
        d["size"] = s.size;
        d["hit_rate"] = s.hit_rate();
        return d;
      });
}
