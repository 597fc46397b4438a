#include "component/ViewRef.h"

#include "shared/ViewHostErrors.h"
#include "shared/ViewHostLogger.h"

#include <string>

namespace viewhost {

void DestroyRef::destroy() {
  // Callbacks may register more callbacks; those wait for the next destroy().
  const std::size_t count = destroyCallbacks_.size();
  for (std::size_t i = 0; i < count; ++i) {
    auto callback = destroyCallbacks_[i];
    if (callback) {
      callback();
    }
  }
  destroyed_ = true;
}

void DestroyRef::onDestroy(DestroyCallback callback) {
  if (destroyed_) {
    logDevWarning("onDestroy registered on a destroyed view; it runs only if destroy() is called again");
  }
  destroyCallbacks_.push_back(std::move(callback));
}

void throwNotImplemented(const char* operation) {
  throw NotImplementedError(std::string("NotImplemented: ") + operation);
}

} // namespace viewhost
