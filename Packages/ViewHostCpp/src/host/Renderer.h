#pragma once

#include "host/NativeElement.h"

#include <memory>
#include <string>

namespace viewhost {

// Renderer kind token declared by a component definition.
struct RendererType {
  std::string id;
};

// Renderer defines how the runtime creates and mutates native surface nodes.
class Renderer {
public:
  virtual ~Renderer() = default;

  virtual std::shared_ptr<NativeElement> createElement(const std::string& tagName) = 0;
  virtual std::shared_ptr<NativeElement> createText(const std::string& value) = 0;

  virtual void appendChild(
      const std::shared_ptr<NativeElement>& parent,
      const std::shared_ptr<NativeElement>& child) = 0;

  virtual void insertBefore(
      const std::shared_ptr<NativeElement>& parent,
      const std::shared_ptr<NativeElement>& child,
      const std::shared_ptr<NativeElement>& beforeChild) = 0;

  virtual void removeChild(
      const std::shared_ptr<NativeElement>& parent,
      const std::shared_ptr<NativeElement>& child) = 0;

  virtual void setAttribute(
      const std::shared_ptr<NativeElement>& element,
      const std::string& name,
      const std::string& value) = 0;

  virtual void removeAttribute(
      const std::shared_ptr<NativeElement>& element,
      const std::string& name) = 0;

  // Replaces the value of a text node.
  virtual void setValue(
      const std::shared_ptr<NativeElement>& node,
      const std::string& value) = 0;

  // Returns null when nothing matches.
  virtual std::shared_ptr<NativeElement> selectRootElement(const std::string& selector) = 0;
};

class RendererFactory {
public:
  virtual ~RendererFactory() = default;

  // hostElement and type are null when the caller only needs the default
  // renderer (e.g. to resolve a host selector).
  virtual std::shared_ptr<Renderer> createRenderer(
      const std::shared_ptr<NativeElement>& hostElement,
      const RendererType* type) = 0;

  // Bracket every change detection pass.
  virtual void begin() {}
  virtual void end() {}
};

} // namespace viewhost
