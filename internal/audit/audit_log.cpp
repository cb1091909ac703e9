#include "audit_log.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/registry/json_codec.hpp"
#include "internal/util/time.hpp"

namespace fleet::audit {

using registry::model::AuditEntry;

AuditLog::AuditLog(std::shared_ptr<kv::KeyValueStore> kv, std::chrono::hours retention) : kv_(std::move(kv)), retention_(retention) {
  if (!kv_) {
    throw std::invalid_argument("AuditLog requires a key-value store");
  }
}

std::vector<AuditEntry> AuditLog::ReadUnlocked() {
  std::vector<AuditEntry> entries;

  const auto raw = kv_->Get(kAuditsKey);
  if (!raw || raw->empty()) {
    return entries;
  }

  const auto value = registry::codec::ParseJson(*raw);
  if (value.kind_case() == google::protobuf::Value::kNullValue) {
    return entries;
  }
  if (value.kind_case() != google::protobuf::Value::kListValue) {
    throw std::runtime_error("audits is not a JSON array");
  }

  for (const auto& item : value.list_value().values()) {
    entries.push_back(registry::codec::DecodeAuditEntry(item));
  }
  return entries;
}

void AuditLog::Record(AuditEntry entry) {
  const auto now = util::Now();
  if (entry.timestamp.empty()) {
    entry.timestamp = util::ToIso8601(now);
  }

  try {
    std::lock_guard lock(mutex_);

    const auto cutoff = now - retention_;

    google::protobuf::Value value;
    auto*                   list = value.mutable_list_value();
    for (const auto& existing : ReadUnlocked()) {
      util::TimePoint at;
      // unparseable timestamps cannot be aged out and are dropped with the rest
      if (!util::ParseIso8601(existing.timestamp, &at) || at < cutoff) {
        continue;
      }
      *list->add_values() = registry::codec::EncodeAuditEntry(existing);
    }
    *list->add_values() = registry::codec::EncodeAuditEntry(entry);

    kv::ThrowIfKvError(kv_->Set(kAuditsKey, registry::codec::ToJson(value)), "write audits");
  } catch (const std::exception& e) {
    FLEET_LOG_ERROR("audit entry not recorded",
                    {observability::StringField("action", entry.action), observability::StringField("error", e.what())});
  }
}

std::vector<AuditEntry> AuditLog::List() {
  std::lock_guard lock(mutex_);
  return ReadUnlocked();
}

} // namespace fleet::audit
