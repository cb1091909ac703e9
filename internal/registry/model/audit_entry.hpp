#pragma once

#include <string>

namespace fleet::registry::model {

struct AuditEntry {
  std::string user_id;
  std::string username;
  std::string action;
  std::string ip;
  std::string timestamp;  // ISO-8601 UTC
};

} // namespace fleet::registry::model
