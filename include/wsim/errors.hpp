#pragma once
#include <stdexcept>

namespace wsim {

// Malformed ledger, snapshot, action or world-definition content.
class CodecError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The ledger could not durably persist a batch. Fatal to the tick.
class LedgerWriteError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Replayed or stored state disagrees with what was recorded. Never corrected.
class IntegrityError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Bad startup configuration.
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace wsim
