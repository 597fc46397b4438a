#include "host/HostLocator.h"

#include "shared/ViewHostErrors.h"

namespace viewhost {

std::shared_ptr<NativeElement> locateHostElement(
    RendererFactory& factory,
    const HostRef& elementOrSelector) {
  if (const auto* selector = std::get_if<std::string>(&elementOrSelector)) {
    auto defaultRenderer = factory.createRenderer(nullptr, nullptr);
    std::shared_ptr<NativeElement> element =
        defaultRenderer ? defaultRenderer->selectRootElement(*selector) : nullptr;
    if (!element) {
      throw HostResolutionError("Host node is required: " + *selector);
    }
    return element;
  }

  const auto& element = std::get<std::shared_ptr<NativeElement>>(elementOrSelector);
  if (!element) {
    throw HostResolutionError("Host element is required");
  }
  return element;
}

} // namespace viewhost
