#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace viewhost {

enum class NativeNodeKind : std::uint8_t {
  Element = 1,
  Text = 3,
};

// A node of the in-memory native surface. Elements carry a tag, attributes and
// children; text nodes carry only a value.
class NativeElement : public std::enable_shared_from_this<NativeElement> {
public:
  NativeElement(NativeNodeKind kind, std::string tagName, std::string text);

  static std::shared_ptr<NativeElement> createElement(std::string tagName);
  static std::shared_ptr<NativeElement> createText(std::string text);

  NativeNodeKind kind() const {
    return kind_;
  }

  bool isText() const {
    return kind_ == NativeNodeKind::Text;
  }

  const std::string& tagName() const {
    return tagName_;
  }

  // True when `node` is this element or one of its descendants.
  bool contains(const NativeElement* node) const;

  // Appending a node that already has a parent moves it. Appending an
  // ancestor is ignored.
  void appendChild(std::shared_ptr<NativeElement> child);
  void insertChildBefore(
    std::shared_ptr<NativeElement> child,
    const std::shared_ptr<NativeElement>& beforeChild);
  void removeChild(const std::shared_ptr<NativeElement>& child);

  const std::vector<std::shared_ptr<NativeElement>>& children() const {
    return children_;
  }

  std::shared_ptr<NativeElement> parentElement() const {
    return parent_.lock();
  }

  void setAttribute(const std::string& name, const std::string& value);
  void removeAttribute(const std::string& name);
  std::optional<std::string> getAttribute(const std::string& name) const;
  bool hasAttribute(const std::string& name) const;

  const std::map<std::string, std::string>& attributes() const {
    return attributes_;
  }

  bool hasClass(const std::string& className) const;

  // Text nodes replace their value; elements replace all children with a
  // single text node.
  void setTextContent(const std::string& text);
  std::string textContent() const;

  std::string outerHTML() const;
  std::string innerHTML() const;

private:
  void detachFromParent();

  NativeNodeKind kind_;
  std::string tagName_;
  std::string text_;
  std::map<std::string, std::string> attributes_{};
  std::weak_ptr<NativeElement> parent_{};
  std::vector<std::shared_ptr<NativeElement>> children_{};
};

} // namespace viewhost
