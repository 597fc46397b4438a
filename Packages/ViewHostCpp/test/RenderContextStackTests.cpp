#include "runtime/ViewHostRuntime.h"
#include "shared/ViewHostErrors.h"
#include "shared/ViewHostFeatureFlags.h"
#include "view/RenderContextStack.h"

#include "TestComponents.h"

#include <cassert>
#include <memory>

namespace viewhost::test {

bool runRenderContextStackTests() {
  ViewHostRuntime runtime;
  assert(currentView(runtime) == nullptr);
  assert(renderContextDepth(runtime) == 0);

  // First entry returns null and makes the context current
  auto outer = createRenderContext(rootElementIndex, nullptr);
  auto previousOuter = enterView(runtime, outer);
  assert(previousOuter == nullptr);
  assert(currentView(runtime) == outer);
  assert(renderContextDepth(runtime) == 1);

  // Nested entry returns the outer context
  auto inner = createRenderContext(rootElementIndex, nullptr);
  auto previousInner = enterView(runtime, inner);
  assert(previousInner == outer);
  assert(currentView(runtime) == inner);
  assert(renderContextDepth(runtime) == 2);

  // Mismatched leave is rejected in dev mode and leaves the stack untouched
  if constexpr (devModeEnabled) {
    auto stray = createRenderContext(rootElementIndex, nullptr);
    assert(throwsError<ContextNestingError>([&]() { leaveView(runtime, stray); }));
    assert(currentView(runtime) == inner);
    assert(renderContextDepth(runtime) == 2);
  }

  leaveView(runtime, previousInner);
  assert(currentView(runtime) == outer);
  assert(renderContextDepth(runtime) == 1);

  leaveView(runtime, previousOuter);
  assert(currentView(runtime) == nullptr);
  assert(renderContextDepth(runtime) == 0);

  // Leaving with nothing entered
  if constexpr (devModeEnabled) {
    assert(throwsError<ContextNestingError>([&]() { leaveView(runtime, nullptr); }));
    assert(renderContextDepth(runtime) == 0);
  }

  // Re-entering the same context is allowed and unwinds symmetrically
  auto again = enterView(runtime, outer);
  auto twice = enterView(runtime, outer);
  assert(again == nullptr);
  assert(twice == outer);
  leaveView(runtime, twice);
  assert(currentView(runtime) == outer);
  leaveView(runtime, again);
  assert(currentView(runtime) == nullptr);

  // Contexts start in creation mode with no data
  auto fresh = createRenderContext(3, nullptr, {std::any(1), std::any(2)});
  assert(fresh->elementIndex == 3);
  assert(fresh->creationMode);
  assert(fresh->data.size() == 2);
  assert(fresh->boundValues.empty());

  // Runtimes do not share stacks
  ViewHostRuntime other;
  enterView(runtime, outer);
  assert(currentView(other) == nullptr);
  runtime.reset();
  assert(currentView(runtime) == nullptr);
  assert(renderContextDepth(runtime) == 0);

  return true;
}

} // namespace viewhost::test
