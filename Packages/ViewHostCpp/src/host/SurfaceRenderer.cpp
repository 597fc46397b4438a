#include "host/SurfaceRenderer.h"

#include <utility>

namespace viewhost {

SurfaceRenderer::SurfaceRenderer(std::shared_ptr<NativeSurface> surface)
  : surface_(std::move(surface)) {}

std::shared_ptr<NativeElement> SurfaceRenderer::createElement(const std::string& tagName) {
  return surface_->createElement(tagName);
}

std::shared_ptr<NativeElement> SurfaceRenderer::createText(const std::string& value) {
  return surface_->createTextNode(value);
}

void SurfaceRenderer::appendChild(
    const std::shared_ptr<NativeElement>& parent,
    const std::shared_ptr<NativeElement>& child) {
  if (parent) {
    parent->appendChild(child);
  }
}

void SurfaceRenderer::insertBefore(
    const std::shared_ptr<NativeElement>& parent,
    const std::shared_ptr<NativeElement>& child,
    const std::shared_ptr<NativeElement>& beforeChild) {
  if (parent) {
    parent->insertChildBefore(child, beforeChild);
  }
}

void SurfaceRenderer::removeChild(
    const std::shared_ptr<NativeElement>& parent,
    const std::shared_ptr<NativeElement>& child) {
  if (parent) {
    parent->removeChild(child);
  }
}

void SurfaceRenderer::setAttribute(
    const std::shared_ptr<NativeElement>& element,
    const std::string& name,
    const std::string& value) {
  if (element) {
    element->setAttribute(name, value);
  }
}

void SurfaceRenderer::removeAttribute(
    const std::shared_ptr<NativeElement>& element,
    const std::string& name) {
  if (element) {
    element->removeAttribute(name);
  }
}

void SurfaceRenderer::setValue(
    const std::shared_ptr<NativeElement>& node,
    const std::string& value) {
  if (node) {
    node->setTextContent(value);
  }
}

std::shared_ptr<NativeElement> SurfaceRenderer::selectRootElement(const std::string& selector) {
  return surface_->querySelector(selector);
}

SurfaceRendererFactory::SurfaceRendererFactory(std::shared_ptr<NativeSurface> surface)
  : surface_(std::move(surface)),
    renderer_(std::make_shared<SurfaceRenderer>(surface_)) {}

std::shared_ptr<Renderer> SurfaceRendererFactory::createRenderer(
    const std::shared_ptr<NativeElement>& hostElement,
    const RendererType* type) {
  (void)hostElement;
  (void)type;
  return renderer_;
}

void SurfaceRendererFactory::begin() {
  ++openFrames_;
}

void SurfaceRendererFactory::end() {
  if (openFrames_ == 0) {
    return;
  }
  --openFrames_;
  ++frameCount_;
}

} // namespace viewhost
