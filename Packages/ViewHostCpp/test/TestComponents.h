#pragma once

#include "ViewHost.h"

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace viewhost::test {

struct Counter {
  int count{0};
  std::string label{"counter"};
  int renderCount{0};
};

// <x-widget><span data-label="...">{count}</span></x-widget>
inline ComponentDef<Counter> counterDef(std::string tag = "x-widget") {
  ComponentDef<Counter> def;
  def.tag = std::move(tag);
  def.factory = []() { return std::make_shared<Counter>(); };
  def.rendererType = RendererType{"counter"};
  def.render = [](Counter& counter, ViewInstructions& view) {
    ++counter.renderCount;
    if (view.creationMode()) {
      view.elementStart(0, "span");
      view.text(1);
      view.elementEnd();
    }
    view.textBinding(1, std::to_string(counter.count));
    view.elementAttribute(0, "data-label", counter.label);
  };
  return def;
}

// A surface holding one element per tag, with its own renderer factory.
struct TestHost {
  std::shared_ptr<NativeSurface> surface;
  std::shared_ptr<SurfaceRendererFactory> factory;
  std::shared_ptr<NativeElement> host;
};

inline TestHost makeTestHost(const std::string& tag = "x-widget") {
  TestHost fixture;
  fixture.surface = std::make_shared<NativeSurface>();
  fixture.factory = std::make_shared<SurfaceRendererFactory>(fixture.surface);
  fixture.host = fixture.surface->createElement(tag);
  fixture.surface->body()->appendChild(fixture.host);
  return fixture;
}

// Queues scheduled callbacks until the test drains them.
struct ManualScheduler {
  std::vector<Task> queued;
  std::size_t scheduleCalls{0};

  SchedulerFn fn() {
    return [this](Task task) {
      ++scheduleCalls;
      queued.push_back(std::move(task));
    };
  }

  std::size_t drain() {
    std::vector<Task> tasks;
    tasks.swap(queued);
    for (auto& task : tasks) {
      task();
    }
    return tasks.size();
  }
};

// Forwards to a SurfaceRenderer and counts every write.
class CountingRenderer : public Renderer {
public:
  explicit CountingRenderer(std::shared_ptr<NativeSurface> surface)
    : inner_(std::move(surface)) {}

  std::shared_ptr<NativeElement> createElement(const std::string& tagName) override {
    ++createElementCalls;
    return inner_.createElement(tagName);
  }

  std::shared_ptr<NativeElement> createText(const std::string& value) override {
    ++createTextCalls;
    return inner_.createText(value);
  }

  void appendChild(
      const std::shared_ptr<NativeElement>& parent,
      const std::shared_ptr<NativeElement>& child) override {
    inner_.appendChild(parent, child);
  }

  void insertBefore(
      const std::shared_ptr<NativeElement>& parent,
      const std::shared_ptr<NativeElement>& child,
      const std::shared_ptr<NativeElement>& beforeChild) override {
    inner_.insertBefore(parent, child, beforeChild);
  }

  void removeChild(
      const std::shared_ptr<NativeElement>& parent,
      const std::shared_ptr<NativeElement>& child) override {
    inner_.removeChild(parent, child);
  }

  void setAttribute(
      const std::shared_ptr<NativeElement>& element,
      const std::string& name,
      const std::string& value) override {
    ++setAttributeCalls;
    inner_.setAttribute(element, name, value);
  }

  void removeAttribute(
      const std::shared_ptr<NativeElement>& element,
      const std::string& name) override {
    inner_.removeAttribute(element, name);
  }

  void setValue(
      const std::shared_ptr<NativeElement>& node,
      const std::string& value) override {
    ++setValueCalls;
    inner_.setValue(node, value);
  }

  std::shared_ptr<NativeElement> selectRootElement(const std::string& selector) override {
    ++selectRootElementCalls;
    return inner_.selectRootElement(selector);
  }

  std::size_t createElementCalls{0};
  std::size_t createTextCalls{0};
  std::size_t setAttributeCalls{0};
  std::size_t setValueCalls{0};
  std::size_t selectRootElementCalls{0};

private:
  SurfaceRenderer inner_;
};

class CountingRendererFactory : public RendererFactory {
public:
  explicit CountingRendererFactory(std::shared_ptr<NativeSurface> surface)
    : renderer(std::make_shared<CountingRenderer>(std::move(surface))) {}

  std::shared_ptr<Renderer> createRenderer(
      const std::shared_ptr<NativeElement>& hostElement,
      const RendererType* type) override {
    ++createRendererCalls;
    if (type != nullptr) {
      lastRendererTypeId = type->id;
    }
    (void)hostElement;
    return renderer;
  }

  void begin() override {
    ++beginCalls;
  }

  void end() override {
    ++endCalls;
  }

  std::shared_ptr<CountingRenderer> renderer;
  std::size_t createRendererCalls{0};
  std::size_t beginCalls{0};
  std::size_t endCalls{0};
  std::string lastRendererTypeId;
};

template <typename Error, typename Fn>
bool throwsError(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

template <typename Error, typename Fn>
std::string errorMessage(Fn&& fn) {
  try {
    fn();
  } catch (const Error& error) {
    return error.what();
  }
  return std::string{};
}

} // namespace viewhost::test
