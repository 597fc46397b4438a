#include "view/ViewInstructions.h"

#include "runtime/ViewHostRuntime.h"
#include "shared/ViewHostAssert.h"
#include "shared/ViewHostFeatureFlags.h"
#include "view/HostNode.h"
#include "view/RenderContextStack.h"

#include <cstddef>
#include <string>
#include <utility>

namespace viewhost {

ViewInstructions::ViewInstructions(ViewHostRuntime& runtime)
  : runtime_(runtime) {}

RenderContext& ViewInstructions::view() const {
  const auto& current = currentView(runtime_);
  if (!current) {
    throw AssertionError("assertion failed: no render context is active");
  }
  return *current;
}

bool ViewInstructions::creationMode() const {
  return view().creationMode;
}

std::shared_ptr<NativeElement> ViewInstructions::nodeAt(RenderContext& context, int index) const {
  std::shared_ptr<NativeElement> node;
  if (index >= 0 && static_cast<std::size_t>(index) < context.data.size()) {
    if (const auto* stored = std::any_cast<std::shared_ptr<NativeElement>>(&context.data[index])) {
      node = *stored;
    }
  }

  if constexpr (devModeEnabled) {
    assertTrue(node != nullptr, "no node created at index " + std::to_string(index));
  }
  return node;
}

void ViewInstructions::storeNode(RenderContext& context, int index, std::shared_ptr<NativeElement> node) {
  if constexpr (devModeEnabled) {
    assertTrue(index >= 0, "node index must not be negative");
  }
  if (index < 0) {
    return;
  }

  const auto slot = static_cast<std::size_t>(index);
  if (slot >= context.data.size()) {
    context.data.resize(slot + 1);
  }
  context.data[slot] = std::move(node);
}

void ViewInstructions::elementStart(int index, const std::string& tagName) {
  auto& context = view();
  context.elementIndex = index;

  std::shared_ptr<NativeElement> element;
  if (context.creationMode) {
    element = context.renderer->createElement(tagName);
    context.renderer->appendChild(context.currentParent, element);
    storeNode(context, index, element);
  } else {
    element = nodeAt(context, index);
  }

  context.parentStack.push_back(context.currentParent);
  context.currentParent = std::move(element);
}

void ViewInstructions::elementEnd() {
  auto& context = view();
  if constexpr (devModeEnabled) {
    assertTrue(!context.parentStack.empty(), "elementEnd without a matching elementStart");
  }
  if (context.parentStack.empty()) {
    return;
  }

  context.currentParent = std::move(context.parentStack.back());
  context.parentStack.pop_back();
}

void ViewInstructions::text(int index, const std::string& value) {
  auto& context = view();
  if (!context.creationMode) {
    return;
  }

  auto node = context.renderer->createText(value);
  context.renderer->appendChild(context.currentParent, node);
  storeNode(context, index, std::move(node));
}

void ViewInstructions::textBinding(int index, const std::string& value) {
  auto& context = view();
  const auto key = std::make_pair(index, std::string{});
  auto it = context.boundValues.find(key);
  if (it != context.boundValues.end() && it->second == value) {
    return;
  }

  context.renderer->setValue(nodeAt(context, index), value);
  context.boundValues[key] = value;
}

void ViewInstructions::elementAttribute(int index, const std::string& name, const std::string& value) {
  auto& context = view();
  const auto key = std::make_pair(index, name);
  auto it = context.boundValues.find(key);
  if (it != context.boundValues.end() && it->second == value) {
    return;
  }

  context.renderer->setAttribute(nodeAt(context, index), name, value);
  context.boundValues[key] = value;
}

void renderComponentOrTemplate(ViewHostRuntime& runtime, HostNode& hostNode) {
  auto previous = enterView(runtime, hostNode.view);
  auto* factory = hostNode.rendererFactory.get();

  try {
    if (factory != nullptr) {
      factory->begin();
    }
    hostNode.view->currentParent = hostNode.native;
    hostNode.view->parentStack.clear();
    if (hostNode.render) {
      ViewInstructions instructions(runtime);
      hostNode.render(instructions);
    }
  } catch (...) {
    if (factory != nullptr) {
      factory->end();
    }
    hostNode.view->creationMode = false;
    leaveView(runtime, std::move(previous));
    throw;
  }

  if (factory != nullptr) {
    factory->end();
  }
  hostNode.view->creationMode = false;
  leaveView(runtime, std::move(previous));
}

} // namespace viewhost
