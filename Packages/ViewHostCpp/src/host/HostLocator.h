#pragma once

#include "host/NativeElement.h"
#include "host/Renderer.h"

#include <memory>
#include <string>
#include <variant>

namespace viewhost {

// Either a native element to bootstrap into or a selector to look one up by.
using HostRef = std::variant<std::shared_ptr<NativeElement>, std::string>;

// Throws HostResolutionError when the selector matches nothing or the element
// is null.
std::shared_ptr<NativeElement> locateHostElement(
    RendererFactory& factory,
    const HostRef& elementOrSelector);

} // namespace viewhost
