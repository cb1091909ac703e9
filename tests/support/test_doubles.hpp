#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/kv/api/kv_store.hpp"
#include "internal/kv/memory/memory_kv_store.hpp"
#include "internal/probe/http_client.hpp"

namespace fleet::testing {

/*
  HttpClient answering from a script keyed by "host:port/path".
  Unscripted targets behave like a refused connection.
*/
class FakeHttpClient final : public probe::HttpClient {
 public:
  void On(const std::string& host, uint32_t port, const std::string& path, probe::HttpResponse response,
          std::chrono::milliseconds delay = std::chrono::milliseconds::zero()) {
    std::lock_guard lock(mutex_);
    script_[Key(host, port, path)] = Scripted{std::move(response), delay};
  }

  void OnJson(const std::string& host, uint32_t port, const std::string& path, const std::string& body,
              std::chrono::milliseconds delay = std::chrono::milliseconds::zero()) {
    probe::HttpResponse response;
    response.status = 200;
    response.body   = body;
    On(host, port, path, std::move(response), delay);
  }

  void Clear(const std::string& host, uint32_t port, const std::string& path) {
    std::lock_guard lock(mutex_);
    script_.erase(Key(host, port, path));
  }

  probe::HttpResponse Get(const probe::HttpRequest& request) override {
    std::optional<Scripted> scripted;
    {
      std::lock_guard lock(mutex_);
      requests_.push_back(request);
      const auto it = script_.find(Key(request.host, request.port, request.path));
      if (it != script_.end()) scripted = it->second;
    }

    const int running = ++in_flight_;
    int       peak    = peak_in_flight_.load();
    while (running > peak && !peak_in_flight_.compare_exchange_weak(peak, running)) {
    }

    if (scripted && scripted->delay.count() > 0) {
      std::this_thread::sleep_for(scripted->delay);
    }
    --in_flight_;

    if (!scripted) {
      probe::HttpResponse refused;
      refused.error = "Connection refused";
      return refused;
    }
    return scripted->response;
  }

  std::vector<probe::HttpRequest> requests() {
    std::lock_guard lock(mutex_);
    return requests_;
  }

  std::size_t CallCount(const std::string& path) {
    std::lock_guard lock(mutex_);
    std::size_t     count = 0;
    for (const auto& request : requests_) {
      if (request.path == path) ++count;
    }
    return count;
  }

  int peak_in_flight() const {
    return peak_in_flight_.load();
  }

 private:
  struct Scripted {
    probe::HttpResponse       response;
    std::chrono::milliseconds delay{0};
  };

  static std::string Key(const std::string& host, uint32_t port, const std::string& path) {
    return host + ":" + std::to_string(port) + path;
  }

  std::mutex                      mutex_;
  std::map<std::string, Scripted> script_;
  std::vector<probe::HttpRequest> requests_;
  std::atomic<int>                in_flight_{0};
  std::atomic<int>                peak_in_flight_{0};
};

/*
  In-memory store that counts mutations and can be told to fail them.
*/
class CountingKeyValueStore final : public kv::KeyValueStore {
 public:
  std::optional<std::string> Get(const std::string& key) override {
    return inner_.Get(key);
  }

  kv::Result Set(const std::string& key, const std::string& value) override {
    ++writes_;
    if (fail_writes_) return kv::Result::Err(kv::ErrorCode::IOError, "injected write failure");
    return inner_.Set(key, value);
  }

  kv::Result Delete(const std::string& key) override {
    ++writes_;
    if (fail_writes_) return kv::Result::Err(kv::ErrorCode::IOError, "injected delete failure");
    return inner_.Delete(key);
  }

  int writes() const {
    return writes_.load();
  }

  void fail_writes(bool fail) {
    fail_writes_ = fail;
  }

 private:
  kv::memory::MemoryKeyValueStore inner_;
  std::atomic<int>                writes_{0};
  std::atomic<bool>               fail_writes_{false};
};

} // namespace fleet::testing
