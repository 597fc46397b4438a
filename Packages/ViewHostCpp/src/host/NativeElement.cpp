#include "host/NativeElement.h"

#include <algorithm>
#include <sstream>
#include <utility>

namespace viewhost {

namespace {

std::string escapeText(const std::string& value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const char ch : value) {
    switch (ch) {
      case '&':
        escaped += "&amp;";
        break;
      case '<':
        escaped += "&lt;";
        break;
      case '>':
        escaped += "&gt;";
        break;
      case '"':
        escaped += "&quot;";
        break;
      default:
        escaped += ch;
        break;
    }
  }
  return escaped;
}

} // namespace

NativeElement::NativeElement(NativeNodeKind kind, std::string tagName, std::string text)
  : kind_(kind),
    tagName_(std::move(tagName)),
    text_(std::move(text)) {}

std::shared_ptr<NativeElement> NativeElement::createElement(std::string tagName) {
  return std::make_shared<NativeElement>(NativeNodeKind::Element, std::move(tagName), std::string{});
}

std::shared_ptr<NativeElement> NativeElement::createText(std::string text) {
  return std::make_shared<NativeElement>(NativeNodeKind::Text, "#text", std::move(text));
}

void NativeElement::detachFromParent() {
  if (auto parent = parent_.lock()) {
    parent->removeChild(shared_from_this());
  }
  parent_.reset();
}

bool NativeElement::contains(const NativeElement* node) const {
  for (auto* current = node; current != nullptr;) {
    if (current == this) {
      return true;
    }
    auto parent = current->parent_.lock();
    current = parent.get();
  }
  return false;
}

void NativeElement::appendChild(std::shared_ptr<NativeElement> child) {
  // A node cannot be moved under itself or one of its descendants.
  if (!child || isText() || child->contains(this)) {
    return;
  }

  child->detachFromParent();
  child->parent_ = shared_from_this();
  children_.push_back(std::move(child));
}

void NativeElement::insertChildBefore(
  std::shared_ptr<NativeElement> child,
  const std::shared_ptr<NativeElement>& beforeChild) {
  if (!child || isText() || child->contains(this)) {
    return;
  }

  if (!beforeChild || beforeChild == child) {
    appendChild(std::move(child));
    return;
  }

  child->detachFromParent();

  auto beforeIt = std::find(children_.begin(), children_.end(), beforeChild);
  if (beforeIt == children_.end()) {
    appendChild(std::move(child));
    return;
  }

  child->parent_ = shared_from_this();
  children_.insert(beforeIt, std::move(child));
}

void NativeElement::removeChild(const std::shared_ptr<NativeElement>& child) {
  if (!child) {
    return;
  }

  auto it = std::find(children_.begin(), children_.end(), child);
  if (it == children_.end()) {
    return;
  }

  (*it)->parent_.reset();
  children_.erase(it);
}

void NativeElement::setAttribute(const std::string& name, const std::string& value) {
  if (isText()) {
    return;
  }
  attributes_[name] = value;
}

void NativeElement::removeAttribute(const std::string& name) {
  attributes_.erase(name);
}

std::optional<std::string> NativeElement::getAttribute(const std::string& name) const {
  auto it = attributes_.find(name);
  if (it == attributes_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool NativeElement::hasAttribute(const std::string& name) const {
  return attributes_.find(name) != attributes_.end();
}

bool NativeElement::hasClass(const std::string& className) const {
  auto it = attributes_.find("class");
  if (it == attributes_.end() || className.empty()) {
    return false;
  }

  std::istringstream classes(it->second);
  std::string entry;
  while (classes >> entry) {
    if (entry == className) {
      return true;
    }
  }
  return false;
}

void NativeElement::setTextContent(const std::string& text) {
  if (isText()) {
    text_ = text;
    return;
  }

  for (auto& child : children_) {
    child->parent_.reset();
  }
  children_.clear();

  if (!text.empty()) {
    appendChild(createText(text));
  }
}

std::string NativeElement::textContent() const {
  if (isText()) {
    return text_;
  }

  std::string text;
  for (const auto& child : children_) {
    text += child->textContent();
  }
  return text;
}

std::string NativeElement::innerHTML() const {
  if (isText()) {
    return escapeText(text_);
  }

  std::string html;
  for (const auto& child : children_) {
    html += child->outerHTML();
  }
  return html;
}

std::string NativeElement::outerHTML() const {
  if (isText()) {
    return escapeText(text_);
  }

  std::string html = "<" + tagName_;
  for (const auto& [name, value] : attributes_) {
    html += " " + name + "=\"" + escapeText(value) + "\"";
  }
  html += ">";
  html += innerHTML();
  html += "</" + tagName_ + ">";
  return html;
}

} // namespace viewhost
