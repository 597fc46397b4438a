#include "runtime/ViewHostRuntime.h"

#include "host/SurfaceRenderer.h"

#include <utility>

namespace viewhost {

ViewHostRuntime::ViewHostRuntime()
  : ViewHostRuntime(std::make_shared<NativeSurface>()) {}

ViewHostRuntime::ViewHostRuntime(std::shared_ptr<NativeSurface> surface)
  : surface_(surface ? std::move(surface) : std::make_shared<NativeSurface>()) {}

RenderContextStackState& ViewHostRuntime::renderContextStack() {
  return renderContextStack_;
}

const RenderContextStackState& ViewHostRuntime::renderContextStack() const {
  return renderContextStack_;
}

DirtySchedulerState& ViewHostRuntime::dirtyState() {
  return dirtyState_;
}

const DirtySchedulerState& ViewHostRuntime::dirtyState() const {
  return dirtyState_;
}

FrameScheduler& ViewHostRuntime::frameScheduler() {
  return frameScheduler_;
}

const FrameScheduler& ViewHostRuntime::frameScheduler() const {
  return frameScheduler_;
}

void ViewHostRuntime::setDefaultRendererFactory(std::shared_ptr<RendererFactory> factory) {
  defaultRendererFactory_ = std::move(factory);
}

std::shared_ptr<RendererFactory> ViewHostRuntime::defaultRendererFactory() {
  if (!defaultRendererFactory_) {
    defaultRendererFactory_ = std::make_shared<SurfaceRendererFactory>(surface_);
  }
  return defaultRendererFactory_;
}

void ViewHostRuntime::registerHostNode(const void* component, std::shared_ptr<HostNode> hostNode) {
  if (component == nullptr || !hostNode) {
    return;
  }
  hostNodes_[component] = std::move(hostNode);
}

std::shared_ptr<HostNode> ViewHostRuntime::findHostNode(const void* component) const {
  auto it = hostNodes_.find(component);
  if (it == hostNodes_.end()) {
    return nullptr;
  }
  return it->second;
}

bool ViewHostRuntime::unregisterComponent(const void* component) {
  return hostNodes_.erase(component) > 0;
}

std::size_t ViewHostRuntime::getRegisteredComponentCount() const {
  return hostNodes_.size();
}

void ViewHostRuntime::requestFrame(Task task) {
  frameScheduler_.requestFrame(std::move(task));
}

void ViewHostRuntime::reset() {
  renderContextStack_ = RenderContextStackState{};
  dirtyState_ = DirtySchedulerState{};
  frameScheduler_.clear();
  hostNodes_.clear();
}

} // namespace viewhost
