#pragma once

#include "host/NativeElement.h"
#include "view/RenderContext.h"

#include <memory>
#include <string>

namespace viewhost {

class ViewHostRuntime;
struct HostNode;

// The instruction set a component's render function drives. Instructions act
// on the runtime's current render context; creation instructions build nodes
// on the first pass only, binding instructions write through the renderer
// only when the bound value changed.
class ViewInstructions {
public:
  explicit ViewInstructions(ViewHostRuntime& runtime);

  bool creationMode() const;

  void elementStart(int index, const std::string& tagName);
  void elementEnd();
  void text(int index, const std::string& value = {});
  void textBinding(int index, const std::string& value);
  void elementAttribute(int index, const std::string& name, const std::string& value);

private:
  RenderContext& view() const;
  std::shared_ptr<NativeElement> nodeAt(RenderContext& context, int index) const;
  void storeNode(RenderContext& context, int index, std::shared_ptr<NativeElement> node);

  ViewHostRuntime& runtime_;
};

// Enters the host node's view, runs its render function between the renderer
// factory's begin() and end(), and leaves creation mode. The view is left and
// end() called on every exit path.
void renderComponentOrTemplate(ViewHostRuntime& runtime, HostNode& hostNode);

} // namespace viewhost
