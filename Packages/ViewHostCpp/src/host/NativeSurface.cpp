#include "host/NativeSurface.h"

#include <algorithm>
#include <cctype>
#include <optional>

namespace viewhost {

namespace {

struct SimpleSelector {
  std::string tagName;
  std::string id;
  std::vector<std::string> classNames;
};

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return value;
}

std::optional<SimpleSelector> parseSelector(const std::string& selector) {
  SimpleSelector parsed;
  if (selector.empty()) {
    return std::nullopt;
  }

  char mode = '\0';
  std::string token;

  auto flush = [&]() -> bool {
    if (mode == '\0') {
      parsed.tagName = toLower(token);
    } else if (token.empty()) {
      return false;
    } else if (mode == '#') {
      parsed.id = token;
    } else {
      parsed.classNames.push_back(token);
    }
    token.clear();
    return true;
  };

  for (const char ch : selector) {
    if (ch == '#' || ch == '.') {
      if (!flush()) {
        return std::nullopt;
      }
      mode = ch;
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(ch)) || ch == '>' || ch == '[' || ch == ',') {
      return std::nullopt;
    }
    token += ch;
  }

  if (!flush()) {
    return std::nullopt;
  }
  return parsed;
}

bool matches(const NativeElement& element, const SimpleSelector& selector) {
  if (element.isText()) {
    return false;
  }
  if (!selector.tagName.empty() && toLower(element.tagName()) != selector.tagName) {
    return false;
  }
  if (!selector.id.empty() && element.getAttribute("id") != selector.id) {
    return false;
  }
  for (const auto& className : selector.classNames) {
    if (!element.hasClass(className)) {
      return false;
    }
  }
  return true;
}

void collectMatches(
    const std::shared_ptr<NativeElement>& element,
    const SimpleSelector& selector,
    bool firstOnly,
    std::vector<std::shared_ptr<NativeElement>>& out) {
  if (!element || (firstOnly && !out.empty())) {
    return;
  }

  if (matches(*element, selector)) {
    out.push_back(element);
    if (firstOnly) {
      return;
    }
  }

  for (const auto& child : element->children()) {
    collectMatches(child, selector, firstOnly, out);
    if (firstOnly && !out.empty()) {
      return;
    }
  }
}

} // namespace

NativeSurface::NativeSurface()
  : body_(NativeElement::createElement("body")) {}

std::shared_ptr<NativeElement> NativeSurface::createElement(const std::string& tagName) const {
  return NativeElement::createElement(tagName);
}

std::shared_ptr<NativeElement> NativeSurface::createTextNode(const std::string& text) const {
  return NativeElement::createText(text);
}

std::shared_ptr<NativeElement> NativeSurface::querySelector(const std::string& selector) const {
  auto parsed = parseSelector(selector);
  if (!parsed) {
    return nullptr;
  }

  std::vector<std::shared_ptr<NativeElement>> found;
  collectMatches(body_, *parsed, true, found);
  return found.empty() ? nullptr : found.front();
}

std::vector<std::shared_ptr<NativeElement>> NativeSurface::querySelectorAll(const std::string& selector) const {
  std::vector<std::shared_ptr<NativeElement>> found;
  auto parsed = parseSelector(selector);
  if (parsed) {
    collectMatches(body_, *parsed, false, found);
  }
  return found;
}

std::string NativeSurface::serialize() const {
  return body_->outerHTML();
}

} // namespace viewhost
