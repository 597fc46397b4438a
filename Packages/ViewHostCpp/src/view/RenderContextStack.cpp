#include "view/RenderContextStack.h"

#include "runtime/ViewHostRuntime.h"
#include "shared/ViewHostErrors.h"
#include "shared/ViewHostFeatureFlags.h"

#include <utility>

namespace viewhost {

std::shared_ptr<RenderContext> createRenderContext(
    int elementIndex,
    std::shared_ptr<Renderer> renderer,
    std::vector<std::any> data) {
  auto context = std::make_shared<RenderContext>();
  context->elementIndex = elementIndex;
  context->renderer = std::move(renderer);
  context->data = std::move(data);
  return context;
}

std::shared_ptr<RenderContext> enterView(
    ViewHostRuntime& runtime,
    std::shared_ptr<RenderContext> context) {
  auto& state = runtime.renderContextStack();
  auto previous = std::move(state.current);
  state.previousValues.push_back(previous);
  state.current = std::move(context);
  return previous;
}

void leaveView(ViewHostRuntime& runtime, std::shared_ptr<RenderContext> previous) {
  auto& state = runtime.renderContextStack();

  if constexpr (devModeEnabled) {
    if (state.previousValues.empty()) {
      throw ContextNestingError("leaveView called without a matching enterView");
    }
    if (state.previousValues.back() != previous) {
      throw ContextNestingError(
          "leaveView called out of order: context does not match the innermost enterView");
    }
  }

  if (!state.previousValues.empty()) {
    state.previousValues.pop_back();
  }
  state.current = std::move(previous);
}

const std::shared_ptr<RenderContext>& currentView(const ViewHostRuntime& runtime) {
  return runtime.renderContextStack().current;
}

std::size_t renderContextDepth(const ViewHostRuntime& runtime) {
  return runtime.renderContextStack().previousValues.size();
}

} // namespace viewhost
