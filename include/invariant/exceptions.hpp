#pragma once
#include <stdexcept>

namespace invariant {

/// base for all failed parameter checks
class InvariantError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// a required value was absent (null pointer, empty optional, json null)
class MissingValueError : public InvariantError {
 public:
  using InvariantError::InvariantError;
};

/// a value was present but blank, out of bounds or of the wrong shape
class InvalidArgumentError : public InvariantError {
 public:
  using InvariantError::InvariantError;
};

}  // namespace invariant
