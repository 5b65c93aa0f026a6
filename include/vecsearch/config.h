#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "vecsearch/distance.h"

namespace vecsearch {

namespace config {

// ---------------------------------------------------------
// Graph hyperparameters
// ---------------------------------------------------------

// Max links per node on layers >= 1. Layer 0 allows 2 * M.
constexpr std::size_t kDefaultM = 16;

// Candidate list width while inserting. Higher = better graph, slower build.
constexpr std::size_t kDefaultEfConstruction = 200;

// Beam width for queries when the caller does not override it.
constexpr std::size_t kDefaultEfSearch = 64;

// Upper clamp for per-query ef overrides.
constexpr std::size_t kDefaultMaxEfSearch = 1024;

// Collections at or below this many live records are searched exactly.
constexpr std::size_t kDefaultBruteForceThreshold = 32;

// Warn once the share of retired slots passes this ratio.
constexpr double kDefaultTombstoneWarnRatio = 0.25;

// ---------------------------------------------------------
// Query path
// ---------------------------------------------------------

constexpr std::chrono::milliseconds kDefaultDeadline{200};
constexpr std::chrono::milliseconds kDefaultEmbedBudget{40};

// Below this share of the deadline remaining, ef is scaled down.
constexpr double kDefaultComfortableBudgetFraction = 0.5;

// Candidates pulled from the index when a reranker will run.
constexpr std::size_t kDefaultRerankDepth = 50;

constexpr std::size_t kDefaultCacheCapacity = 1024;
constexpr std::chrono::seconds kDefaultCacheTtl{300};
constexpr std::size_t kDefaultCacheShards = 8;

} // namespace config

struct IndexParams {
  std::size_t M = config::kDefaultM;
  std::size_t ef_construction = config::kDefaultEfConstruction;
  std::size_t ef_search = config::kDefaultEfSearch;
  std::size_t max_ef_search = config::kDefaultMaxEfSearch;

  // Throws InvalidParameter.
  void validate() const;
};

struct CollectionConfig {
  std::string name;
  std::size_t dimension = 0;
  Metric metric = Metric::COSINE;
  IndexParams index;
  bool rerank_enabled = false;
  std::size_t brute_force_threshold = config::kDefaultBruteForceThreshold;
  std::uint64_t seed = 42;
  double tombstone_warn_ratio = config::kDefaultTombstoneWarnRatio;

  void validate() const;
};

struct CacheConfig {
  std::size_t capacity = config::kDefaultCacheCapacity;
  std::chrono::milliseconds ttl = config::kDefaultCacheTtl;
  std::size_t shards = config::kDefaultCacheShards;

  void validate() const;
};

struct OrchestratorConfig {
  std::chrono::milliseconds deadline = config::kDefaultDeadline;
  std::chrono::milliseconds embed_budget = config::kDefaultEmbedBudget;
  double comfortable_budget_fraction = config::kDefaultComfortableBudgetFraction;
  std::size_t rerank_depth = config::kDefaultRerankDepth;

  // Degraded responses (deadline hit, cancelled, rerank skipped) are not
  // cached unless this is set.
  bool cache_degraded_results = false;

  void validate() const;
};

struct EngineConfig {
  CacheConfig cache;
  OrchestratorConfig orchestrator;
  std::string log_level = "info";

  // Reads VECSEARCH_* variables on top of the defaults. Unparseable values
  // keep the default.
  static EngineConfig from_env();
};

// "1/true/yes/on" and "0/false/no/off", case-insensitive.
bool parse_bool(const char* value, bool fallback);

} // namespace vecsearch
