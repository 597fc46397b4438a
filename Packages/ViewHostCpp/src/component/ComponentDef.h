#pragma once

#include "host/Renderer.h"

#include <functional>
#include <memory>
#include <string>

namespace viewhost {

class ViewInstructions;

// Immutable description of a component kind. `tag` is the selector used to
// find a host when a bootstrap names none; `render` is run on every change
// detection pass.
template <typename T>
struct ComponentDef {
  std::string tag;
  std::function<std::shared_ptr<T>()> factory;
  RendererType rendererType{};
  std::function<void(T&, ViewInstructions&)> render{};
};

} // namespace viewhost
