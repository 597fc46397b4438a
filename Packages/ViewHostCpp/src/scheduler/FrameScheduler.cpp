#include "scheduler/FrameScheduler.h"

#include "shared/ViewHostLogger.h"

#include <exception>
#include <iterator>
#include <utility>

namespace viewhost {

void FrameScheduler::requestFrame(Task task) {
  if (!task) {
    return;
  }
  pending_.push_back(std::move(task));
}

std::size_t FrameScheduler::flushFrame() {
  if (flushing_) {
    return 0;
  }

  std::vector<Task> frame;
  frame.swap(pending_);
  flushing_ = true;

  std::size_t completed = 0;
  for (std::size_t i = 0; i < frame.size(); ++i) {
    try {
      frame[i]();
      ++completed;
    } catch (const std::exception& ex) {
      logScheduledTaskError(ex);
    } catch (...) {
      // Unknown exceptions abort the frame; the callbacks that did not run yet
      // go back to the front of the queue.
      pending_.insert(
          pending_.begin(),
          std::make_move_iterator(frame.begin() + static_cast<std::ptrdiff_t>(i + 1)),
          std::make_move_iterator(frame.end()));
      flushing_ = false;
      throw;
    }
  }

  flushing_ = false;
  return completed;
}

void FrameScheduler::clear() {
  pending_.clear();
}

} // namespace viewhost
