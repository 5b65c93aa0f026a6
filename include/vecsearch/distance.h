#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace vecsearch {

// Distances are computed in float. Every index in this library orders
// candidates by a lower-is-better "distance" derived from the collection's
// metric; user-facing scores are converted back with score_from_distance().
//
//   COSINE     distance = 1 - cos(a, b)      score = cos(a, b)
//   DOT        distance = -<a, b>            score = <a, b>
//   EUCLIDEAN  distance = |a - b|^2          score = |a - b|

enum class Metric : std::uint8_t {
  COSINE = 0,
  DOT = 1,
  EUCLIDEAN = 2,
};

float l2_squared_scalar(const float* a, const float* b, std::size_t dim) noexcept;
float inner_product_scalar(const float* a, const float* b, std::size_t dim) noexcept;

// AVX2 implementations (compiled in conditionally). The dispatcher lives in .cpp.
float l2_squared_avx2(const float* a, const float* b, std::size_t dim) noexcept;
float inner_product_avx2(const float* a, const float* b, std::size_t dim) noexcept;

// Chooses the best available kernel at compile-time.
float l2_squared(const float* a, const float* b, std::size_t dim) noexcept;
float inner_product(const float* a, const float* b, std::size_t dim) noexcept;

float l2_norm(const float* a, std::size_t dim) noexcept;

// Scales `v` to unit length in place. Zero vectors are left untouched.
void normalize(float* v, std::size_t dim) noexcept;

// `a_norm` / `b_norm` are only read for COSINE; callers cache them per row.
float distance(Metric metric, const float* a, float a_norm, const float* b, float b_norm,
               std::size_t dim) noexcept;

float score_from_distance(Metric metric, float distance) noexcept;

// Score of a vector against itself. For DOT this is the unit-length value.
float identity_score(Metric metric) noexcept;

const char* metric_name(Metric metric) noexcept;

// Accepts "cosine", "dot"/"ip"/"inner_product", "euclidean"/"l2".
// Throws InvalidParameter for anything else.
Metric parse_metric(const std::string& name);

} // namespace vecsearch
