#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace fleet::probe {

struct HttpRequest {
  std::string host;
  uint32_t    port = 0;
  std::string path = "/";

  // basic auth, sent when username is not empty
  std::string username;
  std::string password;

  std::chrono::milliseconds timeout{3000};
};

/*
  Outcome of one request.

  status == 0 means no HTTP response was received (connect failure,
  timeout, ...), with the transport error in `error`.
*/
struct HttpResponse {
  int         status = 0;
  std::string body;
  std::string error;

  bool ok() const {
    return status >= 200 && status < 300;
  }
};

/*
  Outbound HTTP seam used to talk to node daemons.

  Implementations must be safe to call from several probe workers at once
  and must not throw for transport failures.
*/
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual HttpResponse Get(const HttpRequest& request) = 0;
};

} // namespace fleet::probe
