#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/service/node_admin_service.hpp"

namespace fleet::kv { class KeyValueStore; }
namespace fleet::monitor { class ProbePool; }
namespace fleet::probe { class HttpClient; }

namespace fleet::factory {

/*
  Application

  Everything the server binary keeps alive for the lifetime of the
  process. grpc_services is handed over to runtime::Server.
*/
struct Application {
  std::shared_ptr<kv::KeyValueStore>              kv;
  std::shared_ptr<monitor::ProbePool>             probe_pool;
  std::shared_ptr<service::NodeAdminService>      admin_service;
  std::vector<std::unique_ptr<::grpc::Service>>   grpc_services;
};

/*
  Build

  Composition root. The only place that knows the concrete key-value
  backend and HTTP client.

  http may be injected (tests); by default the cpp-httplib client is used.
*/
Application Build(const fleet::runtime::config::RuntimeConfig& config, std::shared_ptr<probe::HttpClient> http = nullptr);

} // namespace fleet::factory
