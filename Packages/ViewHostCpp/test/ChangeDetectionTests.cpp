#include "ViewHost.h"

#include "TestComponents.h"

#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>

namespace viewhost::test {

bool runChangeDetectionTests() {
  auto fixture = makeTestHost();
  auto counting = std::make_shared<CountingRendererFactory>(fixture.surface);
  ViewHostRuntime runtime(fixture.surface);
  runtime.setDefaultRendererFactory(counting);
  auto def = counterDef();

  auto counter = renderComponent(runtime, def);
  assert(counter->renderCount == 1);
  assert(counting->renderer->setValueCalls == 1);
  assert(counting->renderer->setAttributeCalls == 1);

  // Unchanged bindings are not written again and nothing is re-created
  detectChanges(runtime, counter);
  assert(counter->renderCount == 2);
  assert(counting->renderer->setValueCalls == 1);
  assert(counting->renderer->setAttributeCalls == 1);
  assert(counting->renderer->createElementCalls == 1);
  assert(counting->renderer->createTextCalls == 1);
  assert(counting->beginCalls == 2);
  assert(counting->endCalls == 2);

  // Changed bindings are written once
  counter->count = 3;
  detectChanges(runtime, *counter);
  assert(counting->renderer->setValueCalls == 2);
  assert(counting->renderer->setAttributeCalls == 1);
  assert(fixture.host->outerHTML() ==
         "<x-widget><span data-label=\"counter\">3</span></x-widget>");

  counter->label = "renamed";
  detectChanges(runtime, counter);
  assert(counting->renderer->setAttributeCalls == 2);
  assert(fixture.host->children().size() == 1);
  assert(fixture.host->children()[0]->getAttribute("data-label").value() == "renamed");
  assert(runtime.dirtyState().completedPassCount == 4);

  // A pass clears a pending dirty flag
  ManualScheduler scheduler;
  markDirty(runtime, counter, scheduler.fn());
  assert(isDirty(runtime));
  detectChanges(runtime, counter);
  assert(!isDirty(runtime));

  // Instances that were never bootstrapped are rejected
  auto stranger = std::make_shared<Counter>();
  auto message = errorMessage<NotAHostInstanceError>([&]() { detectChanges(runtime, stranger); });
  assert(message.find("Not a directive instance") == 0);
  assert(throwsError<NotAHostInstanceError>([&]() { getHostElement(runtime, stranger); }));
  assert(renderContextDepth(runtime) == 0);

  // Null instances are rejected the same way in every build
  auto nullMessage = errorMessage<NotAHostInstanceError>([&]() {
    detectChanges(runtime, std::shared_ptr<Counter>{});
  });
  assert(nullMessage == "Not a directive instance: component must be defined");
  assert(throwsError<NotAHostInstanceError>([&]() {
    getHostElement(runtime, std::shared_ptr<Counter>{});
  }));

  // A throwing render still unwinds the context and closes the frame
  def.render = [](Counter& instance, ViewInstructions& view) {
    ++instance.renderCount;
    if (view.creationMode()) {
      view.elementStart(0, "b");
      view.elementEnd();
    }
    if (instance.count < 0) {
      throw std::runtime_error("negative count");
    }
  };
  auto second = fixture.surface->createElement("x-widget");
  fixture.surface->body()->appendChild(second);
  BootstrapOptions<Counter> options;
  options.host = HostRef{second};
  auto fragile = renderComponent(runtime, def, options);
  fragile->count = -1;
  const auto endsBefore = counting->endCalls;
  assert(throwsError<std::runtime_error>([&]() { detectChanges(runtime, fragile); }));
  assert(counting->endCalls == endsBefore + 1);
  assert(renderContextDepth(runtime) == 0);
  fragile->count = 0;
  detectChanges(runtime, fragile);
  assert(second->outerHTML() == "<x-widget><b></b></x-widget>");

  // Unregistered instances no longer resolve
  assert(runtime.unregisterComponent(counter.get()));
  assert(!runtime.unregisterComponent(counter.get()));
  assert(throwsError<NotAHostInstanceError>([&]() { detectChanges(runtime, counter); }));

  // Lookups are per runtime
  ViewHostRuntime other(fixture.surface);
  assert(throwsError<NotAHostInstanceError>([&]() { getHostElement(other, fragile); }));

  return true;
}

} // namespace viewhost::test
