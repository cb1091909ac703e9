#pragma once

#include "fleet/registry/v1/node.pb.h"
#include "fleet/registry/v1/node_admin_service.pb.h"
#include "fleet/registry/v1/node_admin_service.grpc.pb.h"
