#pragma once

#include "host/NativeSurface.h"
#include "host/Renderer.h"
#include "scheduler/DirtySchedulerState.h"
#include "scheduler/FrameScheduler.h"
#include "view/HostNode.h"
#include "view/RenderContextStack.h"

#include <cstddef>
#include <memory>
#include <unordered_map>

namespace viewhost {

// All mutable state of one component host: the render context stack, the
// dirty flag, the instance -> host node side table, the default renderer
// factory and the frame scheduler. Independent runtimes share nothing.
class ViewHostRuntime {
public:
  ViewHostRuntime();
  explicit ViewHostRuntime(std::shared_ptr<NativeSurface> surface);

  ViewHostRuntime(const ViewHostRuntime&) = delete;
  ViewHostRuntime& operator=(const ViewHostRuntime&) = delete;

  RenderContextStackState& renderContextStack();
  const RenderContextStackState& renderContextStack() const;
  DirtySchedulerState& dirtyState();
  const DirtySchedulerState& dirtyState() const;
  FrameScheduler& frameScheduler();
  const FrameScheduler& frameScheduler() const;

  const std::shared_ptr<NativeSurface>& surface() const {
    return surface_;
  }

  // Used by bootstraps that do not name a renderer factory. Defaults to a
  // SurfaceRendererFactory over surface().
  void setDefaultRendererFactory(std::shared_ptr<RendererFactory> factory);
  std::shared_ptr<RendererFactory> defaultRendererFactory();

  void registerHostNode(const void* component, std::shared_ptr<HostNode> hostNode);
  std::shared_ptr<HostNode> findHostNode(const void* component) const;
  bool unregisterComponent(const void* component);

  [[nodiscard]] std::size_t getRegisteredComponentCount() const;

  void requestFrame(Task task);

  // Drops every registered component, pending frame callback and context,
  // and clears the dirty flag.
  void reset();

private:
  std::shared_ptr<NativeSurface> surface_;
  std::shared_ptr<RendererFactory> defaultRendererFactory_{};
  RenderContextStackState renderContextStack_{};
  DirtySchedulerState dirtyState_{};
  FrameScheduler frameScheduler_{};
  std::unordered_map<const void*, std::shared_ptr<HostNode>> hostNodes_{};
};

} // namespace viewhost
