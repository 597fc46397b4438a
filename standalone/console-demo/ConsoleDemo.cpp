#include "ViewHost.h"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace viewhost::console {

namespace demo {

struct Chip {
  std::string label;
  bool active{false};
};

struct ChipBar {
  std::vector<Chip> chips;
  int clicks{0};
};

ComponentDef<ChipBar> chipBarDef() {
  ComponentDef<ChipBar> def;
  def.tag = "#demo-root";
  def.factory = []() {
    auto bar = std::make_shared<ChipBar>();
    bar->chips = {{"alpha"}, {"beta"}, {"gamma"}};
    return bar;
  };
  def.rendererType = RendererType{"chip-bar"};
  def.render = [](ChipBar& bar, ViewInstructions& view) {
    if (view.creationMode()) {
      view.elementStart(0, "ul");
      int index = 1;
      for (const auto& chip : bar.chips) {
        view.elementStart(index, "li");
        view.text(index + 1, chip.label);
        view.elementEnd();
        index += 2;
      }
      view.elementEnd();
      view.elementStart(index, "p");
      view.text(index + 1);
      view.elementEnd();
    }

    int index = 1;
    for (const auto& chip : bar.chips) {
      view.elementAttribute(index, "class", chip.active ? "chip active" : "chip");
      index += 2;
    }
    view.textBinding(index + 1, "clicks: " + std::to_string(bar.clicks));
  };
  return def;
}

void printStep(const std::string& title, const NativeSurface& surface) {
  std::cout << "-- " << title << '\n' << surface.serialize() << '\n';
}

} // namespace demo

} // namespace viewhost::console

int main() {
  using namespace viewhost;
  using namespace viewhost::console;

  auto surface = std::make_shared<NativeSurface>();
  auto root = surface->createElement("div");
  root->setAttribute("id", "demo-root");
  surface->body()->appendChild(root);

  ViewHostRuntime runtime(surface);
  const auto def = demo::chipBarDef();

  try {
    auto ref = createComponentRef(runtime, def);
    ref.onDestroy([]() { std::cout << "-- destroyed\n"; });
    demo::printStep("bootstrap", *surface);

    // Several updates in one frame render once.
    ref.instance->chips[1].active = true;
    markDirty(runtime, ref.instance);
    ref.instance->clicks = 1;
    markDirty(runtime, ref.instance);
    runtime.frameScheduler().flushFrame();
    demo::printStep("class update", *surface);

    ref.instance->chips[1].active = false;
    ref.instance->chips[2].active = true;
    ref.instance->clicks = 2;
    ref.changeDetectorRef->detectChanges();
    demo::printStep("direct detectChanges", *surface);

    ref.destroy();
  } catch (const std::exception& error) {
    std::cerr << "console demo failed: " << error.what() << std::endl;
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
