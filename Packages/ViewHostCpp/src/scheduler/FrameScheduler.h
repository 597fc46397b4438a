#pragma once

#include <cstddef>
#include <functional>
#include <vector>

namespace viewhost {

using Task = std::function<void()>;

// Stand-in for the host's per-frame callback mechanism. The embedding
// application calls flushFrame() once per frame.
class FrameScheduler {
public:
  void requestFrame(Task task);

  // Runs the callbacks that were pending when the flush started; callbacks
  // requested while flushing wait for the next frame. A callback throwing a
  // std::exception is logged and the rest of the frame still runs. Returns the
  // number of callbacks that completed. Reentrant calls return 0.
  std::size_t flushFrame();

  std::size_t pendingCount() const {
    return pending_.size();
  }

  bool isFlushing() const {
    return flushing_;
  }

  void clear();

private:
  std::vector<Task> pending_{};
  bool flushing_{false};
};

} // namespace viewhost
