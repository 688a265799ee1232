#pragma once

#include <stdexcept>
#include <string>

namespace autotrader {

// -----------------------------------------------------------------------------
// Engine exception types
// -----------------------------------------------------------------------------
//
// @details
// Failures that a caller may want to tell apart are thrown as one of these
// std::runtime_error subclasses. Expected outcomes (risk rejections, closing
// an already-closed position) are returned as values instead.
//
//   ConfigError       configuration file missing, malformed or out of range.
//   MarketDataError   no usable snapshot for the requested symbol.
//   ExecutionError    an order or price request failed at the execution
//                     layer (venue error, bridge timeout, rejected order).
//   PersistenceError  the store could not read or write its files.
//
// The orchestrator catches std::exception at the cycle boundary, so any of
// these aborts the current cycle and triggers the error backoff.
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

class MarketDataError : public std::runtime_error {
 public:
  explicit MarketDataError(const std::string& what)
      : std::runtime_error(what) {}
};

class ExecutionError : public std::runtime_error {
 public:
  explicit ExecutionError(const std::string& what)
      : std::runtime_error(what) {}
};

class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& what)
      : std::runtime_error(what) {}
};

}  // namespace autotrader
