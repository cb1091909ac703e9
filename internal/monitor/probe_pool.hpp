#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace fleet::monitor {

/*
  Fixed-size worker pool for node probes.

  At most `workers` jobs run at once; the rest wait in FIFO order.
  Submit hands back a future that carries the job's result or exception.
  Shutdown drains queued jobs before joining.
*/
class ProbePool {
 public:
  explicit ProbePool(std::size_t workers);
  ~ProbePool();

  ProbePool(const ProbePool&)            = delete;
  ProbePool& operator=(const ProbePool&) = delete;

  template <typename Fn>
  std::future<std::invoke_result_t<Fn>> Submit(Fn fn) {
    using R   = std::invoke_result_t<Fn>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
    auto fut  = task->get_future();
    Enqueue([task] { (*task)(); });
    return fut;
  }

  void Shutdown();

  std::size_t size() const {
    return threads_.size();
  }

 private:
  void                                 Enqueue(std::function<void()> job);
  std::optional<std::function<void()>> Dequeue();
  void                                 Run();

  std::mutex                        mutex_;
  std::condition_variable           cv_;
  std::queue<std::function<void()>> queue_;
  bool                              shutdown_ = false;

  std::vector<std::thread> threads_;
};

} // namespace fleet::monitor
