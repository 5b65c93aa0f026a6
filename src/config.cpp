#include "vecsearch/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

#include "vecsearch/errors.h"
#include "vecsearch/logging.h"

namespace vecsearch {

namespace {

std::string lowercase_trimmed(const char* value) {
  std::string s(value);
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  s = s.substr(first, s.find_last_not_of(" \t\r\n") - first + 1);
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Positive integer from the environment, or `fallback`.
template <typename T>
T env_positive(const char* name, T fallback) {
  const char* raw = std::getenv(name);
  if (!raw) {
    return fallback;
  }
  char* end = nullptr;
  const long long v = std::strtoll(raw, &end, 10);
  if (end == raw || *end != '\0' || v <= 0) {
    logger()->warn("ignoring {}='{}': expected a positive integer", name, raw);
    return fallback;
  }
  return static_cast<T>(v);
}

} // namespace

bool parse_bool(const char* value, bool fallback) {
  if (!value) {
    return fallback;
  }
  const std::string v = lowercase_trimmed(value);
  if (v == "1" || v == "true" || v == "yes" || v == "on") {
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "off") {
    return false;
  }
  return fallback;
}

void IndexParams::validate() const {
  if (M < 2) {
    throw InvalidParameter("M must be >= 2, got " + std::to_string(M));
  }
  if (ef_construction == 0) {
    throw InvalidParameter("ef_construction must be > 0");
  }
  if (ef_search == 0) {
    throw InvalidParameter("ef_search must be > 0");
  }
  if (max_ef_search < ef_search) {
    throw InvalidParameter("max_ef_search (" + std::to_string(max_ef_search) +
                           ") must be >= ef_search (" + std::to_string(ef_search) + ")");
  }
}

void CollectionConfig::validate() const {
  if (name.empty()) {
    throw InvalidParameter("collection name must not be empty");
  }
  if (dimension == 0) {
    throw InvalidParameter("dimension must be > 0");
  }
  if (tombstone_warn_ratio <= 0.0 || tombstone_warn_ratio > 1.0) {
    throw InvalidParameter("tombstone_warn_ratio must be in (0, 1]");
  }
  index.validate();
}

void CacheConfig::validate() const {
  if (capacity == 0) {
    throw InvalidParameter("cache capacity must be > 0");
  }
  if (shards == 0) {
    throw InvalidParameter("cache shards must be > 0");
  }
  if (ttl.count() <= 0) {
    throw InvalidParameter("cache ttl must be > 0");
  }
}

void OrchestratorConfig::validate() const {
  if (deadline.count() <= 0) {
    throw InvalidParameter("deadline must be > 0");
  }
  if (embed_budget.count() <= 0 || embed_budget > deadline) {
    throw InvalidParameter("embed_budget must be in (0, deadline]");
  }
  if (comfortable_budget_fraction <= 0.0 || comfortable_budget_fraction > 1.0) {
    throw InvalidParameter("comfortable_budget_fraction must be in (0, 1]");
  }
  if (rerank_depth == 0) {
    throw InvalidParameter("rerank_depth must be > 0");
  }
}

EngineConfig EngineConfig::from_env() {
  EngineConfig cfg;

  cfg.orchestrator.deadline = std::chrono::milliseconds(
      env_positive<long long>("VECSEARCH_DEADLINE_MS", cfg.orchestrator.deadline.count()));
  cfg.orchestrator.embed_budget = std::chrono::milliseconds(
      env_positive<long long>("VECSEARCH_EMBED_BUDGET_MS", cfg.orchestrator.embed_budget.count()));
  cfg.orchestrator.cache_degraded_results =
      parse_bool(std::getenv("VECSEARCH_CACHE_DEGRADED"), cfg.orchestrator.cache_degraded_results);

  cfg.cache.capacity = env_positive<std::size_t>("VECSEARCH_CACHE_CAPACITY", cfg.cache.capacity);
  cfg.cache.shards = env_positive<std::size_t>("VECSEARCH_CACHE_SHARDS", cfg.cache.shards);
  cfg.cache.ttl = std::chrono::seconds(env_positive<long long>(
      "VECSEARCH_CACHE_TTL_S",
      std::chrono::duration_cast<std::chrono::seconds>(cfg.cache.ttl).count()));

  if (const char* level = std::getenv("VECSEARCH_LOG_LEVEL")) {
    cfg.log_level = lowercase_trimmed(level);
  }

  if (cfg.orchestrator.embed_budget > cfg.orchestrator.deadline) {
    logger()->warn("VECSEARCH_EMBED_BUDGET_MS exceeds the deadline; clamping to {} ms",
                   cfg.orchestrator.deadline.count());
    cfg.orchestrator.embed_budget = cfg.orchestrator.deadline;
  }
  return cfg;
}

} // namespace vecsearch
