#pragma once

#include "host/NativeElement.h"
#include "view/HostNode.h"

#include <memory>

namespace viewhost {

class ViewHostRuntime;

namespace detail {

// Throws NotAHostInstanceError when `component` is null or was not
// bootstrapped by `runtime`.
std::shared_ptr<HostNode> resolveHostNode(const ViewHostRuntime& runtime, const void* component);

void detectChanges(ViewHostRuntime& runtime, const void* component);
std::shared_ptr<NativeElement> getHostElement(const ViewHostRuntime& runtime, const void* component);

} // namespace detail

// Runs one render/update pass over the component's view and clears the
// runtime's dirty flag.
template <typename T>
void detectChanges(ViewHostRuntime& runtime, const std::shared_ptr<T>& component) {
  detail::detectChanges(runtime, component.get());
}

template <typename T>
void detectChanges(ViewHostRuntime& runtime, const T& component) {
  detail::detectChanges(runtime, std::addressof(component));
}

template <typename T>
std::shared_ptr<NativeElement> getHostElement(const ViewHostRuntime& runtime, const std::shared_ptr<T>& component) {
  return detail::getHostElement(runtime, component.get());
}

template <typename T>
std::shared_ptr<NativeElement> getHostElement(const ViewHostRuntime& runtime, const T& component) {
  return detail::getHostElement(runtime, std::addressof(component));
}

} // namespace viewhost
