#pragma once

#include <string>

namespace fleet::registry::model {

/*
  Read view of one entry of the "instances" list.

  The list is owned by the instance subsystem; only the fields below are
  interpreted here.
*/
struct Instance {
  std::string id;            // "Id"
  std::string node_id;       // "Node.id"
  std::string container_id;  // "ContainerId"
  std::string user;          // "User"
  bool        suspended = false;
  std::string suspended_flag;  // "suspended-flagg"
};

} // namespace fleet::registry::model
