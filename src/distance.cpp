#include "vecsearch/distance.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <immintrin.h>
#include <limits>

#include "vecsearch/errors.h"

namespace vecsearch {

namespace {
// Cosine distances below this are a vector against itself (or a scaled copy).
constexpr float kCosineSnap = 8.0f * std::numeric_limits<float>::epsilon();
}

float l2_squared_scalar(const float* a, const float* b, std::size_t dim) noexcept {
  float acc = 0.0f;
  for (std::size_t i = 0; i < dim; ++i) {
    const float d = a[i] - b[i];
    acc += d * d;
  }
  return acc;
}

float inner_product_scalar(const float* a, const float* b, std::size_t dim) noexcept {
  float acc = 0.0f;
  for (std::size_t i = 0; i < dim; ++i) {
    acc += a[i] * b[i];
  }
  return acc;
}

// AVX2 kernels
// Note: We keep these functions available even when AVX2 isn't enabled;
// the dispatcher will call scalar fallbacks when __AVX2__ is not defined.

float l2_squared_avx2(const float* a, const float* b, std::size_t dim) noexcept {
#if defined(__AVX2__)
  __m256 sum = _mm256_setzero_ps();
  std::size_t i = 0;

  for (; i + 8 <= dim; i += 8) {
    const __m256 va = _mm256_loadu_ps(a + i);
    const __m256 vb = _mm256_loadu_ps(b + i);
    const __m256 diff = _mm256_sub_ps(va, vb);
    sum = _mm256_fmadd_ps(diff, diff, sum); // sum += diff * diff
  }

  alignas(32) float tmp[8];
  _mm256_store_ps(tmp, sum);
  float acc = tmp[0] + tmp[1] + tmp[2] + tmp[3] + tmp[4] + tmp[5] + tmp[6] + tmp[7];

  for (; i < dim; ++i) {
    const float d = a[i] - b[i];
    acc += d * d;
  }

  return acc;
#else
  return l2_squared_scalar(a, b, dim);
#endif
}

float inner_product_avx2(const float* a, const float* b, std::size_t dim) noexcept {
#if defined(__AVX2__)
  __m256 sum = _mm256_setzero_ps();
  std::size_t i = 0;

  for (; i + 8 <= dim; i += 8) {
    const __m256 va = _mm256_loadu_ps(a + i);
    const __m256 vb = _mm256_loadu_ps(b + i);
    sum = _mm256_fmadd_ps(va, vb, sum);
  }

  alignas(32) float tmp[8];
  _mm256_store_ps(tmp, sum);
  float acc = tmp[0] + tmp[1] + tmp[2] + tmp[3] + tmp[4] + tmp[5] + tmp[6] + tmp[7];

  for (; i < dim; ++i) {
    acc += a[i] * b[i];
  }

  return acc;
#else
  return inner_product_scalar(a, b, dim);
#endif
}

float l2_squared(const float* a, const float* b, std::size_t dim) noexcept {
#if defined(__AVX2__)
  return l2_squared_avx2(a, b, dim);
#else
  return l2_squared_scalar(a, b, dim);
#endif
}

float inner_product(const float* a, const float* b, std::size_t dim) noexcept {
#if defined(__AVX2__)
  return inner_product_avx2(a, b, dim);
#else
  return inner_product_scalar(a, b, dim);
#endif
}

float l2_norm(const float* a, std::size_t dim) noexcept {
  return std::sqrt(inner_product(a, a, dim));
}

void normalize(float* v, std::size_t dim) noexcept {
  const float n = l2_norm(v, dim);
  if (n == 0.0f) {
    return;
  }
  const float inv = 1.0f / n;
  for (std::size_t i = 0; i < dim; ++i) {
    v[i] *= inv;
  }
}

float distance(Metric metric, const float* a, float a_norm, const float* b, float b_norm,
               std::size_t dim) noexcept {
  switch (metric) {
    case Metric::COSINE: {
      const float denom = a_norm * b_norm;
      if (denom == 0.0f) {
        return 1.0f;
      }
      const float d = 1.0f - inner_product(a, b, dim) / denom;
      // Rounding puts a self-match a few ulps off 0, sometimes below it.
      if (d < kCosineSnap) {
        return 0.0f;
      }
      return std::min(d, 2.0f);
    }
    case Metric::DOT:
      return -inner_product(a, b, dim);
    case Metric::EUCLIDEAN:
      return l2_squared(a, b, dim);
  }
  return l2_squared(a, b, dim);
}

float score_from_distance(Metric metric, float d) noexcept {
  switch (metric) {
    case Metric::COSINE:
      return std::clamp(1.0f - d, -1.0f, 1.0f);
    case Metric::DOT:
      return -d;
    case Metric::EUCLIDEAN:
      return std::sqrt(std::max(d, 0.0f));
  }
  return d;
}

float identity_score(Metric metric) noexcept {
  return metric == Metric::EUCLIDEAN ? 0.0f : 1.0f;
}

const char* metric_name(Metric metric) noexcept {
  switch (metric) {
    case Metric::COSINE:
      return "cosine";
    case Metric::DOT:
      return "dot";
    case Metric::EUCLIDEAN:
      return "euclidean";
  }
  return "unknown";
}

Metric parse_metric(const std::string& name) {
  std::string m(name);
  std::transform(m.begin(), m.end(), m.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (m == "cosine") {
    return Metric::COSINE;
  }
  if (m == "dot" || m == "ip" || m == "inner_product") {
    return Metric::DOT;
  }
  if (m == "euclidean" || m == "l2") {
    return Metric::EUCLIDEAN;
  }
  throw InvalidParameter("Unknown metric: " + name);
}

} // namespace vecsearch
