#pragma once

#include <cstdint>
#include <string>

namespace fleet::registry::model {

enum class NodeStatus {
  Unknown,
  Online,
  Offline,
};

/*
  Operator-supplied part of a node.

  Descriptive fields are free-form. address, port and api_key are the
  only fields checked, and only for presence.
*/
struct NodeSpec {
  std::string name;
  std::string tags;
  std::string ram;
  std::string disk;
  std::string processor;

  std::string address;
  uint32_t    port = 0;
  std::string api_key;
};

/*
  Persistent node record, stored whole under "<id>_node".

  IMPORTANT:
  - status is written by the health prober only. Registry operations may
    reset it to Unknown right before probing.
  - version_family, version_release, remote and docker keep their last
    observed value while the node is offline.
*/
struct NodeRecord {
  std::string id;

  std::string name;
  std::string tags;
  std::string ram;
  std::string disk;
  std::string processor;

  std::string address;
  uint32_t    port = 0;
  std::string api_key;

  NodeStatus status = NodeStatus::Unknown;

  std::string version_family;
  std::string version_release;
  bool        remote = false;
  bool        docker = false;

  // 0 = never probed
  uint64_t last_probed_at_ms = 0;

  // Outstanding one-time key for the configure flow, empty when none.
  std::string configure_key;
};

inline const char* ToString(NodeStatus status) {
  switch (status) {
    case NodeStatus::Online:
      return "Online";
    case NodeStatus::Offline:
      return "Offline";
    case NodeStatus::Unknown:
      return "Unknown";
  }
  return "Unknown";
}

} // namespace fleet::registry::model
