#pragma once

#include "host/NativeElement.h"
#include "host/Renderer.h"
#include "view/RenderContext.h"

#include <functional>
#include <memory>

namespace viewhost {

class ViewInstructions;

// Everything the runtime knows about one bootstrapped component: the native
// host element, the component's own view, the instance and its render entry
// point. Shared by the bootstrapper, the change detector and the view handles.
struct HostNode {
  std::shared_ptr<NativeElement> native{};
  std::shared_ptr<RenderContext> view{};
  std::shared_ptr<RendererFactory> rendererFactory{};
  std::shared_ptr<void> component{};
  std::function<void(ViewInstructions&)> render{};
};

} // namespace viewhost
