#pragma once

#include "component/ChangeDetection.h"
#include "component/ComponentDef.h"
#include "component/ComponentRef.h"
#include "component/Injector.h"
#include "component/ViewRef.h"
#include "host/HostLocator.h"
#include "host/Renderer.h"
#include "runtime/ViewHostRuntime.h"
#include "view/HostNode.h"
#include "view/RenderContextStack.h"

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

namespace viewhost {

template <typename T>
using ComponentFeature = std::function<void(T&, const ComponentDef<T>&)>;

template <typename T>
struct BootstrapOptions {
  // Defaults to the runtime's default renderer factory.
  std::shared_ptr<RendererFactory> rendererFactory{};
  // Defaults to the definition's tag.
  std::optional<HostRef> host{};
  std::shared_ptr<Injector> injector{};
  // Applied in order after the instance exists and before the first pass.
  std::vector<ComponentFeature<T>> features{};
};

namespace detail {

// Creates the host node for `native` in the current render context (index 0)
// together with the component's own view.
std::shared_ptr<HostNode> createHostNode(
    ViewHostRuntime& runtime,
    std::shared_ptr<NativeElement> native,
    std::shared_ptr<RendererFactory> rendererFactory,
    const RendererType& rendererType);

// Stores the instance in the current render context and records the
// instance -> host node back-reference.
void storeComponentInstance(
    ViewHostRuntime& runtime,
    int index,
    std::shared_ptr<void> component,
    const std::shared_ptr<HostNode>& hostNode);

template <typename T>
std::shared_ptr<T> createComponentInstance(const ComponentDef<T>& def) {
  if (!def.factory) {
    throw std::invalid_argument("Component definition '" + def.tag + "' has no factory");
  }
  auto component = def.factory();
  if (!component) {
    throw std::invalid_argument("Component factory for '" + def.tag + "' returned null");
  }
  return component;
}

} // namespace detail

// Bootstraps `def` into an existing host element and runs the first change
// detection pass. If anything throws before that pass completes, the render
// context stack is restored and the instance is unregistered before the
// exception propagates.
template <typename T>
std::shared_ptr<T> renderComponent(
    ViewHostRuntime& runtime,
    const ComponentDef<T>& def,
    const BootstrapOptions<T>& options = {}) {
  auto rendererFactory = options.rendererFactory ? options.rendererFactory : runtime.defaultRendererFactory();
  auto hostElement = locateHostElement(*rendererFactory, options.host ? *options.host : HostRef{def.tag});

  auto rootView = createRenderContext(
      rootElementIndex,
      rendererFactory->createRenderer(hostElement, &def.rendererType));
  auto previous = enterView(runtime, rootView);

  std::shared_ptr<T> component;
  try {
    auto hostNode = detail::createHostNode(runtime, hostElement, rendererFactory, def.rendererType);
    component = detail::createComponentInstance(def);
    if (def.render) {
      auto render = def.render;
      T* target = component.get();
      hostNode->render = [render, target](ViewInstructions& instructions) {
        render(*target, instructions);
      };
    }
    detail::storeComponentInstance(runtime, 1, component, hostNode);
  } catch (...) {
    leaveView(runtime, previous);
    throw;
  }
  leaveView(runtime, previous);

  try {
    for (const auto& feature : options.features) {
      if (feature) {
        feature(*component, def);
      }
    }

    detectChanges(runtime, component);
  } catch (...) {
    runtime.unregisterComponent(component.get());
    throw;
  }
  return component;
}

// renderComponent plus the handles the embedding application manages the
// component through.
template <typename T>
ComponentRef<T> createComponentRef(
    ViewHostRuntime& runtime,
    const ComponentDef<T>& def,
    const BootstrapOptions<T>& options = {}) {
  auto component = renderComponent(runtime, def, options);
  auto hostView = std::make_shared<ViewRef<T>>(
      [&runtime, component]() { detectChanges(runtime, component); },
      component);

  ComponentRef<T> ref;
  ref.location.nativeElement = getHostElement(runtime, component);
  ref.injector = options.injector ? options.injector : nullInjector();
  ref.instance = component;
  ref.hostView = hostView;
  ref.changeDetectorRef = hostView;
  ref.componentType = &def;
  return ref;
}

} // namespace viewhost
