#pragma once
#include <cstddef>
#include <thread>
#include <utility>
#include <vector>

namespace prism::core {

/// @brief Owns a set of worker threads and joins all of them on destruction
/// @details If spawn throws (thread creation or copying the callable failed),
/// the workers already started stay owned and are joined by join() or the destructor.
class WorkerGroup {
public:
  WorkerGroup() = default;
  explicit WorkerGroup(std::size_t capacity) { threads_.reserve(capacity); }
  ~WorkerGroup() { join(); }

  WorkerGroup(const WorkerGroup &) = delete;
  WorkerGroup &operator=(const WorkerGroup &) = delete;

  template <class F>
  void spawn(F &&f) {
    threads_.emplace_back(std::forward<F>(f));
  }

  void join();

  std::size_t size() const { return threads_.size(); }

private:
  std::vector<std::thread> threads_;
};

} // namespace prism::core
