#pragma once

#include "host/NativeElement.h"
#include "host/Renderer.h"

#include <any>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace viewhost {

inline constexpr int rootElementIndex = -1;

// The target construction and update instructions act on: the renderer, the
// per-node data of one view and the bookkeeping of the walk in progress.
struct RenderContext {
  int elementIndex{rootElementIndex};
  std::shared_ptr<Renderer> renderer{};
  std::vector<std::any> data{};
  // True until the first pass over this view has finished.
  bool creationMode{true};
  std::shared_ptr<NativeElement> currentParent{};
  std::vector<std::shared_ptr<NativeElement>> parentStack{};
  // Last value written by a binding, keyed by node index and attribute name
  // (empty name for text bindings).
  std::map<std::pair<int, std::string>, std::string> boundValues{};
};

std::shared_ptr<RenderContext> createRenderContext(
    int elementIndex,
    std::shared_ptr<Renderer> renderer,
    std::vector<std::any> data = {});

} // namespace viewhost
