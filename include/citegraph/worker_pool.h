#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace citegraph {

// Fans independent per-item work out over a fixed number of threads.
// Results keep input order; the first exception thrown by any task is
// rethrown on the calling thread once every worker has joined.
class WorkerPool {
public:
  explicit WorkerPool(std::size_t threads = 0);

  std::size_t Size() const { return threads_; }

  void ForEachIndex(std::size_t count,
                    const std::function<void(std::size_t)> &task) const;

  template <typename Input, typename Function>
  auto Map(const std::vector<Input> &items, Function function) const
      -> std::vector<decltype(function(items.front()))> {
    using Output = decltype(function(items.front()));
    std::vector<std::optional<Output>> slots(items.size());
    ForEachIndex(items.size(), [&](std::size_t index) {
      slots[index].emplace(function(items[index]));
    });
    std::vector<Output> results;
    results.reserve(items.size());
    for (auto &slot : slots) {
      results.push_back(std::move(*slot));
    }
    return results;
  }

  static std::size_t DefaultThreadCount();

private:
  std::size_t threads_;
};

} // namespace citegraph
