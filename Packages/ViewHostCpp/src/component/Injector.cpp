#include "component/Injector.h"

#include "shared/ViewHostErrors.h"

namespace viewhost {

std::any NullInjector::get(
    const std::string& token,
    const std::optional<std::any>& notFoundValue) const {
  (void)notFoundValue;
  throw InjectorNotFoundError("NullInjector: Not found: " + token);
}

std::shared_ptr<Injector> nullInjector() {
  static const std::shared_ptr<Injector> injector = std::make_shared<NullInjector>();
  return injector;
}

} // namespace viewhost
