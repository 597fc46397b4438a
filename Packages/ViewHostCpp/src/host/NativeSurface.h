#pragma once

#include "host/NativeElement.h"

#include <memory>
#include <string>
#include <vector>

namespace viewhost {

// The in-memory document components are bootstrapped into. Selectors support a
// tag name, `#id` and `.class` parts, optionally combined (`div#app.card`).
class NativeSurface {
public:
  NativeSurface();

  const std::shared_ptr<NativeElement>& body() const {
    return body_;
  }

  std::shared_ptr<NativeElement> createElement(const std::string& tagName) const;
  std::shared_ptr<NativeElement> createTextNode(const std::string& text) const;

  // Depth-first, document order, starting at body. Returns null when nothing
  // matches or the selector cannot be parsed.
  std::shared_ptr<NativeElement> querySelector(const std::string& selector) const;
  std::vector<std::shared_ptr<NativeElement>> querySelectorAll(const std::string& selector) const;

  std::string serialize() const;

private:
  std::shared_ptr<NativeElement> body_;
};

} // namespace viewhost
