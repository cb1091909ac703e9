#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "internal/kv/api/result.hpp"

namespace fleet::kv {

/*
  Persistence port.

  A flat key -> JSON text store. Not transactional: callers that
  read-modify-write a key serialize themselves.

  - Get returns nullopt for a missing key and throws on backend failure
  - Set is an upsert of the whole value
  - Delete of a missing key is Ok
*/

class KeyValueStore {
 public:
  virtual ~KeyValueStore() = default;

  virtual std::optional<std::string> Get(const std::string& key) = 0;

  virtual Result Set(const std::string& key, const std::string& value) = 0;

  virtual Result Delete(const std::string& key) = 0;
};

inline void ThrowIfKvError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }
  throw std::runtime_error(result.message.empty() ? context : context + ": " + result.message);
}

} // namespace fleet::kv
