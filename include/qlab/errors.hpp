// SPDX-License-Identifier: MIT

#pragma once
#include <stdexcept>
#include <string>
#include <cstddef>

namespace qlab {

// Base of every error caused by a bad request. Never retried.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class NotFoundError : public Error {
public:
  explicit NotFoundError(const std::string& name)
    : Error("Circuit '" + name + "' not found"), name_(name) {}
  const std::string& name() const { return name_; }
private:
  std::string name_;
};

class DuplicateNameError : public Error {
public:
  explicit DuplicateNameError(const std::string& name)
    : Error("Circuit '" + name + "' already exists"), name_(name) {}
  const std::string& name() const { return name_; }
private:
  std::string name_;
};

class InvalidOperationError : public Error {
public:
  InvalidOperationError(std::size_t index, const std::string& what)
    : Error("Invalid operation #" + std::to_string(index) + ": " + what), index_(index) {}
  std::size_t operation_index() const { return index_; }
private:
  std::size_t index_;
};

class NoMeasurementError : public Error {
public:
  explicit NoMeasurementError(const std::string& name)
    : Error("Circuit '" + name + "' has no measurement; add 'measure' or 'measure_all' before running") {}
};

class MeasurementPresentError : public Error {
public:
  explicit MeasurementPresentError(const std::string& name)
    : Error("Circuit '" + name + "' contains measurements; state analysis needs a unitary-only circuit") {}
};

class InvalidParameterError : public Error {
public:
  using Error::Error;
};

// Internal invariant breach (norm drift, non-unitary gate matrix). Indicates
// an engine bug, not a bad request, hence not derived from qlab::Error.
class NumericalError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

} // namespace qlab
