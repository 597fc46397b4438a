#pragma once

#include "scheduler/FrameScheduler.h"

#include <functional>
#include <memory>

namespace viewhost {

class ViewHostRuntime;

// Any callable that accepts a zero-argument callback and arranges for it to
// run later.
using SchedulerFn = std::function<void(Task)>;

namespace detail {
void markDirty(
    ViewHostRuntime& runtime,
    std::shared_ptr<const void> component,
    const SchedulerFn& scheduler);
} // namespace detail

// Schedules one detection pass for `component` unless a pass is already
// pending on this runtime. An empty scheduler uses the runtime's
// FrameScheduler. The scheduled callback keeps the component alive and refers
// to `runtime`, which must outlive it.
template <typename T>
void markDirty(
    ViewHostRuntime& runtime,
    const std::shared_ptr<T>& component,
    const SchedulerFn& scheduler = {}) {
  detail::markDirty(runtime, std::shared_ptr<const void>(component), scheduler);
}

bool isDirty(const ViewHostRuntime& runtime);

} // namespace viewhost
