#include <citegraph/worker_pool.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

namespace citegraph {

constexpr std::size_t kMaxDefaultThreads = 16;

WorkerPool::WorkerPool(std::size_t threads)
    : threads_(threads == 0 ? DefaultThreadCount() : threads) {}

std::size_t WorkerPool::DefaultThreadCount() {
  std::size_t hardware = std::thread::hardware_concurrency();
  if (hardware == 0) {
    hardware = 4;
  }
  return std::min(hardware, kMaxDefaultThreads);
}

void WorkerPool::ForEachIndex(
    std::size_t count, const std::function<void(std::size_t)> &task) const {
  if (count == 0) {
    return;
  }
  const auto worker_count = std::min(threads_, count);
  if (worker_count <= 1) {
    for (std::size_t i = 0; i < count; ++i) {
      task(i);
    }
    return;
  }

  std::atomic<std::size_t> next{0};
  std::atomic<bool> failed{false};
  std::exception_ptr first_error;
  std::mutex error_mutex;

  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  for (std::size_t t = 0; t < worker_count; ++t) {
    workers.emplace_back([&]() {
      while (!failed.load()) {
        const auto index = next.fetch_add(1);
        if (index >= count) {
          return;
        }
        try {
          task(index);
        } catch (...) {
          std::lock_guard<std::mutex> lock(error_mutex);
          if (!first_error) {
            first_error = std::current_exception();
          }
          failed.store(true);
        }
      }
    });
  }
  for (auto &worker : workers) {
    worker.join();
  }
  if (first_error) {
    std::rethrow_exception(first_error);
  }
}

} // namespace citegraph
