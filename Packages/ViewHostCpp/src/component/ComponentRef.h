#pragma once

#include "component/ComponentDef.h"
#include "component/Injector.h"
#include "component/ViewRef.h"
#include "host/NativeElement.h"

#include <memory>
#include <utility>

namespace viewhost {

struct ElementRef {
  std::shared_ptr<NativeElement> nativeElement{};
};

template <typename T>
struct ComponentRef {
  ElementRef location{};
  std::shared_ptr<Injector> injector{};
  std::shared_ptr<T> instance{};
  std::shared_ptr<ViewRef<T>> hostView{};
  // Same object as hostView.
  std::shared_ptr<ChangeDetectorRef> changeDetectorRef{};
  const ComponentDef<T>* componentType{nullptr};

  // Forward to the host view's lifecycle.
  void destroy() {
    if (hostView) {
      hostView->destroy();
    }
  }

  void onDestroy(DestroyRef::DestroyCallback callback) {
    if (hostView) {
      hostView->onDestroy(std::move(callback));
    }
  }
};

} // namespace viewhost
