#include "probe_pool.hpp"

namespace fleet::monitor {

ProbePool::ProbePool(std::size_t workers) {
  if (workers == 0) {
    throw std::invalid_argument("ProbePool requires at least one worker");
  }
  threads_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads_.emplace_back(&ProbePool::Run, this);
  }
}

ProbePool::~ProbePool() {
  Shutdown();
}

void ProbePool::Enqueue(std::function<void()> job) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      throw std::runtime_error("probe pool is shut down");
    }
    queue_.push(std::move(job));
  }
  cv_.notify_one();
}

std::optional<std::function<void()>> ProbePool::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  auto job = std::move(queue_.front());
  queue_.pop();
  return job;
}

void ProbePool::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();

  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
}

void ProbePool::Run() {
  while (auto job = Dequeue()) {
    // packaged_task stores exceptions in the future
    (*job)();
  }
}

} // namespace fleet::monitor
