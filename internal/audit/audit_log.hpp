#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/kv/api/kv_store.hpp"
#include "internal/registry/model/audit_entry.hpp"

namespace fleet::audit {

/*
  Append-only log of admin actions, kept as one JSON array under "audits".

  Each append drops entries older than the retention window. Recording is
  best effort: a failing store is logged and never fails the admin action.
*/
class AuditLog {
 public:
  static constexpr const char* kAuditsKey = "audits";

  AuditLog(std::shared_ptr<kv::KeyValueStore> kv, std::chrono::hours retention);

  // Fills in the timestamp when the entry has none.
  void Record(registry::model::AuditEntry entry);

  std::vector<registry::model::AuditEntry> List();

 private:
  std::vector<registry::model::AuditEntry> ReadUnlocked();

  std::shared_ptr<kv::KeyValueStore> kv_;
  std::chrono::hours                 retention_;
  std::mutex                         mutex_;
};

} // namespace fleet::audit
