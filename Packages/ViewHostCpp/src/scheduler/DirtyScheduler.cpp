#include "scheduler/DirtyScheduler.h"

#include "component/ChangeDetection.h"
#include "runtime/ViewHostRuntime.h"
#include "shared/ViewHostErrors.h"

#include <utility>

namespace viewhost {
namespace detail {

void markDirty(
    ViewHostRuntime& runtime,
    std::shared_ptr<const void> component,
    const SchedulerFn& scheduler) {
  if (!component) {
    throw NotAHostInstanceError("Not a directive instance: component must be defined");
  }

  auto& dirty = runtime.dirtyState();
  if (dirty.isDirty) {
    return;
  }
  dirty.isDirty = true;

  Task pass = [&runtime, component = std::move(component)]() {
    detectChanges(runtime, component.get());
  };

  try {
    if (scheduler) {
      scheduler(std::move(pass));
    } else {
      runtime.requestFrame(std::move(pass));
    }
  } catch (...) {
    // Nothing was scheduled; reopen the window.
    dirty.isDirty = false;
    throw;
  }
  ++dirty.scheduledPassCount;
}

} // namespace detail

bool isDirty(const ViewHostRuntime& runtime) {
  return runtime.dirtyState().isDirty;
}

} // namespace viewhost
