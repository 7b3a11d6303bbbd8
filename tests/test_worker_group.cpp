#include <atomic>
#include <catch2/catch.hpp>
#include <chrono>
#include <prism/core/worker_group.hpp>
#include <stdexcept>
#include <thread>

using namespace prism::core;

namespace {

// Callable whose copy fails, so std::thread construction throws in the caller
struct FailingTask {
  FailingTask() = default;
  FailingTask(const FailingTask &) { throw std::runtime_error("cannot start worker"); }
  void operator()() const {}
};

} // namespace

TEST_CASE("WorkerGroup joins every started worker", "[core][workers]") {
  std::atomic<int> done{0};
  {
    WorkerGroup group(4);
    for (int i = 0; i < 4; ++i) {
      group.spawn([&done]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        ++done;
      });
    }
    REQUIRE(group.size() == 4);
  }
  REQUIRE(done == 4);
}

TEST_CASE("WorkerGroup survives a failed spawn", "[core][workers]") {
  std::atomic<int> done{0};
  bool caught = false;
  WorkerGroup group(3);

  try {
    for (int i = 0; i < 2; ++i) {
      group.spawn([&done]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ++done;
      });
    }
    const FailingTask task{};
    group.spawn(task);
  } catch (const std::runtime_error &) {
    caught = true;
    group.join();
    // every worker already started has finished before the error is handled
    REQUIRE(done == 2);
  }

  REQUIRE(caught);
  REQUIRE(group.size() == 2);
  group.join();
}
