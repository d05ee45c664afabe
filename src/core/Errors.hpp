#pragma once
#include <stdexcept>
#include <string>

namespace mmig {

// The durable store could not be opened or a statement failed.
// No coordination is possible without the store, so this is fatal to a run.
class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

// Base of everything a source/destination adapter may throw for one item.
class AdapterError : public std::runtime_error {
public:
  explicit AdapterError(const std::string& what) : std::runtime_error(what) {}
};

// Network, rate limit, auth expiry. Retried up to the stage's attempt limit.
class TransientAdapterError : public AdapterError {
public:
  explicit TransientAdapterError(const std::string& what) : AdapterError(what) {}
};

// The item can never succeed (deleted upstream, rejected by the destination).
class PermanentAdapterError : public AdapterError {
public:
  explicit PermanentAdapterError(const std::string& what) : AdapterError(what) {}
};

// Staged content does not match its recorded digest. Retried like transient.
class IntegrityError : public AdapterError {
public:
  explicit IntegrityError(const std::string& what) : AdapterError(what) {}
};

} // namespace mmig
