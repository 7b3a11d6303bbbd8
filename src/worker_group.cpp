#include <prism/core/worker_group.hpp>

namespace prism::core {

void WorkerGroup::join() {
  for (auto &th : threads_) {
    if (th.joinable())
      th.join();
  }
}

} // namespace prism::core
