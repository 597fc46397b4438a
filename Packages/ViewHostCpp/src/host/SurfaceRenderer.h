#pragma once

#include "host/NativeSurface.h"
#include "host/Renderer.h"

#include <cstddef>
#include <memory>

namespace viewhost {

class SurfaceRenderer : public Renderer {
public:
  explicit SurfaceRenderer(std::shared_ptr<NativeSurface> surface);

  std::shared_ptr<NativeElement> createElement(const std::string& tagName) override;
  std::shared_ptr<NativeElement> createText(const std::string& value) override;

  void appendChild(
      const std::shared_ptr<NativeElement>& parent,
      const std::shared_ptr<NativeElement>& child) override;

  void insertBefore(
      const std::shared_ptr<NativeElement>& parent,
      const std::shared_ptr<NativeElement>& child,
      const std::shared_ptr<NativeElement>& beforeChild) override;

  void removeChild(
      const std::shared_ptr<NativeElement>& parent,
      const std::shared_ptr<NativeElement>& child) override;

  void setAttribute(
      const std::shared_ptr<NativeElement>& element,
      const std::string& name,
      const std::string& value) override;

  void removeAttribute(
      const std::shared_ptr<NativeElement>& element,
      const std::string& name) override;

  void setValue(
      const std::shared_ptr<NativeElement>& node,
      const std::string& value) override;

  std::shared_ptr<NativeElement> selectRootElement(const std::string& selector) override;

private:
  std::shared_ptr<NativeSurface> surface_;
};

// Standard renderer factory over a NativeSurface. Every host shares one
// renderer; the renderer type is not used to specialize it.
class SurfaceRendererFactory : public RendererFactory {
public:
  explicit SurfaceRendererFactory(std::shared_ptr<NativeSurface> surface);

  std::shared_ptr<Renderer> createRenderer(
      const std::shared_ptr<NativeElement>& hostElement,
      const RendererType* type) override;

  void begin() override;
  void end() override;

  const std::shared_ptr<NativeSurface>& surface() const {
    return surface_;
  }

  // Number of completed begin/end pairs.
  std::size_t frameCount() const {
    return frameCount_;
  }

  bool inFrame() const {
    return openFrames_ > 0;
  }

private:
  std::shared_ptr<NativeSurface> surface_;
  std::shared_ptr<SurfaceRenderer> renderer_;
  std::size_t frameCount_{0};
  std::size_t openFrames_{0};
};

} // namespace viewhost
