#pragma once

#include "internal/probe/http_client.hpp"

namespace fleet::probe {

/*
  cpp-httplib implementation. A fresh httplib::Client is created per
  request, so concurrent calls share no connection state.
*/
class HttplibClient final : public HttpClient {
 public:
  HttpResponse Get(const HttpRequest& request) override;
};

} // namespace fleet::probe
