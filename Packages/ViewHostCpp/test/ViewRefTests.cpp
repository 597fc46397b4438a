#include "ViewHost.h"

#include "TestComponents.h"

#include <any>
#include <cassert>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace viewhost::test {

bool runViewRefTests() {
  std::vector<std::string> logged;
  setLogSink([&](const std::string& message) { logged.push_back(message); });

  // destroy runs callbacks in registration order, every time
  int passes = 0;
  auto context = std::make_shared<Counter>();
  ViewRef<Counter> view([&]() { ++passes; }, context);
  assert(view.context() == context);
  assert(!view.destroyed());

  std::vector<std::string> calls;
  view.onDestroy([&]() { calls.push_back("a"); });
  view.onDestroy([&]() { calls.push_back("b"); });
  assert(view.destroyCallbackCount() == 2);
  view.destroy();
  assert(view.destroyed());
  assert((calls == std::vector<std::string>{"a", "b"}));
  view.destroy();
  assert((calls == std::vector<std::string>{"a", "b", "a", "b"}));

  // One callback, two destroys
  ViewRef<Counter> single({}, context);
  int singleRuns = 0;
  single.onDestroy([&]() { ++singleRuns; });
  single.destroy();
  single.destroy();
  assert(singleRuns == 2);
  assert(single.destroyed());

  // Late registrations only run on a later destroy
  view.onDestroy([&]() { calls.push_back("c"); });
  assert(calls.size() == 4);
  if constexpr (devModeEnabled) {
    assert(logged.size() == 1);
    assert(logged[0].find("ViewHost warning: ") == 0);
  } else {
    assert(logged.empty());
  }
  view.destroy();
  assert((calls == std::vector<std::string>{"a", "b", "a", "b", "a", "b", "c"}));

  // Callbacks registered while destroying wait for the next destroy
  DestroyRef lifecycle;
  int nested = 0;
  lifecycle.onDestroy([&]() { lifecycle.onDestroy([&]() { ++nested; }); });
  lifecycle.destroy();
  assert(nested == 0);
  assert(lifecycle.destroyCallbackCount() == 2);
  lifecycle.destroy();
  assert(nested == 1);

  // Only detectChanges is supported
  view.detectChanges();
  assert(passes == 1);
  assert(errorMessage<NotImplementedError>([&]() { view.markForCheck(); }) == "NotImplemented: markForCheck");
  assert(throwsError<NotImplementedError>([&]() { view.detach(); }));
  assert(throwsError<NotImplementedError>([&]() { view.checkNoChanges(); }));
  assert(throwsError<NotImplementedError>([&]() { view.reattach(); }));
  ChangeDetectorRef& detector = view;
  assert(throwsError<NotImplementedError>([&]() { detector.markForCheck(); }));
  detector.detectChanges();
  assert(passes == 2);
  assert(std::string(NotImplementedError().what()) == "NotImplemented");

  // ComponentRef forwards its lifecycle to the host view
  auto fixture = makeTestHost();
  ViewHostRuntime runtime(fixture.surface);
  auto def = counterDef();
  auto ref = createComponentRef(runtime, def);
  int destroyedCount = 0;
  ref.onDestroy([&]() { ++destroyedCount; });
  assert(ref.hostView->destroyCallbackCount() == 1);
  ref.destroy();
  assert(destroyedCount == 1);
  assert(ref.hostView->destroyed());

  // Destroy does not detach the instance from the runtime
  assert(runtime.getRegisteredComponentCount() == 1);
  ref.instance->count = 4;
  ref.hostView->detectChanges();
  assert(fixture.host->textContent() == "4");

  // NullInjector never resolves
  auto injector = nullInjector();
  assert(injector == nullInjector());
  assert(errorMessage<InjectorNotFoundError>([&]() { injector->get("Renderer"); }) ==
         "NullInjector: Not found: Renderer");
  assert(throwsError<InjectorNotFoundError>([&]() {
    injector->get("Renderer", std::optional<std::any>(std::any(1)));
  }));

  setLogSink({});
  return true;
}

} // namespace viewhost::test
