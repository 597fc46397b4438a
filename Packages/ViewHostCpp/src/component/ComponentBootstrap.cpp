#include "component/ComponentBootstrap.h"

#include "shared/ViewHostAssert.h"
#include "shared/ViewHostFeatureFlags.h"

#include <any>
#include <cstddef>
#include <utility>

namespace viewhost {
namespace detail {

namespace {

void storeAt(RenderContext& context, int index, std::any value) {
  const auto slot = static_cast<std::size_t>(index);
  if (slot >= context.data.size()) {
    context.data.resize(slot + 1);
  }
  context.data[slot] = std::move(value);
}

RenderContext& requireCurrentView(ViewHostRuntime& runtime) {
  const auto& current = currentView(runtime);
  if (!current) {
    throw AssertionError("assertion failed: no render context is active");
  }
  return *current;
}

} // namespace

std::shared_ptr<HostNode> createHostNode(
    ViewHostRuntime& runtime,
    std::shared_ptr<NativeElement> native,
    std::shared_ptr<RendererFactory> rendererFactory,
    const RendererType& rendererType) {
  auto& context = requireCurrentView(runtime);
  if constexpr (devModeEnabled) {
    assertNotNull(native, "host element");
    assertNotNull(rendererFactory, "renderer factory");
  }

  auto hostNode = std::make_shared<HostNode>();
  hostNode->native = std::move(native);
  hostNode->rendererFactory = std::move(rendererFactory);
  hostNode->view = createRenderContext(
      rootElementIndex,
      hostNode->rendererFactory->createRenderer(hostNode->native, &rendererType));

  context.elementIndex = 0;
  storeAt(context, 0, hostNode);
  return hostNode;
}

void storeComponentInstance(
    ViewHostRuntime& runtime,
    int index,
    std::shared_ptr<void> component,
    const std::shared_ptr<HostNode>& hostNode) {
  auto& context = requireCurrentView(runtime);
  if constexpr (devModeEnabled) {
    assertNotNull(component, "component");
    assertTrue(index > 0, "component instances are stored after their host element");
  }

  storeAt(context, index, component);
  hostNode->component = component;
  runtime.registerHostNode(component.get(), hostNode);
}

} // namespace detail
} // namespace viewhost
