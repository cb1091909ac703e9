#include "httplib_client.hpp"

#include <httplib.h>

#include <utility>

namespace fleet::probe {

namespace {

std::pair<time_t, long> ToTimeoutPair(std::chrono::milliseconds ms) {
  const auto seconds      = std::chrono::duration_cast<std::chrono::seconds>(ms);
  const auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(ms - seconds);
  return {static_cast<time_t>(seconds.count()), static_cast<long>(microseconds.count())};
}

} // namespace

HttpResponse HttplibClient::Get(const HttpRequest& request) {
  HttpResponse response;
  if (request.host.empty() || request.port == 0) {
    response.error = "missing address or port";
    return response;
  }

  httplib::Client client(request.host, static_cast<int>(request.port));

  const auto [sec, usec] = ToTimeoutPair(request.timeout);
  client.set_connection_timeout(sec, usec);
  client.set_read_timeout(sec, usec);
  client.set_write_timeout(sec, usec);
  client.set_keep_alive(false);

  if (!request.username.empty()) {
    client.set_basic_auth(request.username, request.password);
  }

  const httplib::Headers headers = {{"Content-Type", "application/json"}};

  auto result = client.Get(request.path, headers);
  if (!result) {
    response.error = httplib::to_string(result.error());
    return response;
  }

  response.status = result->status;
  response.body   = std::move(result->body);
  return response;
}

} // namespace fleet::probe
