#include "component/ChangeDetection.h"

#include "runtime/ViewHostRuntime.h"
#include "shared/ViewHostErrors.h"
#include "view/ViewInstructions.h"

#include <sstream>

namespace viewhost {
namespace detail {

std::shared_ptr<HostNode> resolveHostNode(const ViewHostRuntime& runtime, const void* component) {
  if (component == nullptr) {
    throw NotAHostInstanceError("Not a directive instance: component must be defined");
  }

  auto hostNode = runtime.findHostNode(component);
  if (!hostNode) {
    std::ostringstream message;
    message << "Not a directive instance: " << component;
    throw NotAHostInstanceError(message.str());
  }
  return hostNode;
}

void detectChanges(ViewHostRuntime& runtime, const void* component) {
  // Held for the whole pass so unregistering mid-pass cannot free the node.
  auto hostNode = resolveHostNode(runtime, component);
  if (!hostNode->view) {
    throw NotAHostInstanceError("Not a directive instance: host node has no view");
  }

  renderComponentOrTemplate(runtime, *hostNode);

  auto& dirty = runtime.dirtyState();
  dirty.isDirty = false;
  ++dirty.completedPassCount;
}

std::shared_ptr<NativeElement> getHostElement(const ViewHostRuntime& runtime, const void* component) {
  return resolveHostNode(runtime, component)->native;
}

} // namespace detail
} // namespace viewhost
