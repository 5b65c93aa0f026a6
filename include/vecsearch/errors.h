#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace vecsearch {

// Error taxonomy
// --------------
// Bad input is reported with std::invalid_argument subclasses and missing
// things with std::out_of_range, like the rest of the library. Degraded
// searches are not errors: they come back with flags on the response.

class ValidationError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

class DimensionMismatch : public ValidationError {
public:
  DimensionMismatch(std::size_t expected, std::size_t actual)
      : ValidationError("dimension mismatch: expected " + std::to_string(expected) + ", got " +
                        std::to_string(actual)),
        expected_(expected),
        actual_(actual) {}

  std::size_t expected() const noexcept { return expected_; }
  std::size_t actual() const noexcept { return actual_; }

private:
  std::size_t expected_;
  std::size_t actual_;
};

class InvalidParameter : public ValidationError {
public:
  using ValidationError::ValidationError;
};

class NotFound : public std::out_of_range {
public:
  using std::out_of_range::out_of_range;
};

class AlreadyExists : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Only raised when a search produced nothing usable before its deadline.
class DeadlineExceeded : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A versioned write lost a race. Callers retry once with a fresh version.
class ConcurrentModificationConflict : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The graph references a node that does not exist. The owning collection
// refuses writes until it is compacted or rebuilt.
class IndexCorruptionDetected : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace vecsearch
