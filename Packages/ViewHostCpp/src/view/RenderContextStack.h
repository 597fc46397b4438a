#pragma once

#include "view/RenderContext.h"

#include <cstddef>
#include <memory>
#include <vector>

namespace viewhost {

class ViewHostRuntime;

struct RenderContextStackState {
  std::shared_ptr<RenderContext> current{};
  // The value each outstanding enterView replaced, innermost last.
  std::vector<std::shared_ptr<RenderContext>> previousValues{};
};

// Makes `context` current and returns the context it replaced (null on the
// first entry). Every call must be paired with leaveView(previous).
std::shared_ptr<RenderContext> enterView(
    ViewHostRuntime& runtime,
    std::shared_ptr<RenderContext> context);

// Restores `previous`. In dev mode, throws ContextNestingError unless
// `previous` is what the innermost outstanding enterView returned.
void leaveView(ViewHostRuntime& runtime, std::shared_ptr<RenderContext> previous);

const std::shared_ptr<RenderContext>& currentView(const ViewHostRuntime& runtime);

std::size_t renderContextDepth(const ViewHostRuntime& runtime);

} // namespace viewhost
