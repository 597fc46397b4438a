#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace viewhost {

class ChangeDetectorRef {
public:
  virtual ~ChangeDetectorRef() = default;

  virtual void markForCheck() = 0;
  virtual void detach() = 0;
  virtual void detectChanges() = 0;
  virtual void checkNoChanges() = 0;
  virtual void reattach() = 0;
};

// Destroy lifecycle shared by every handle. destroy() runs the callbacks
// registered so far, in order, then marks the handle destroyed; calling it
// again runs them again. Callbacks registered after destroy() only run on a
// later destroy().
class DestroyRef {
public:
  using DestroyCallback = std::function<void()>;

  virtual ~DestroyRef() = default;

  void destroy();
  void onDestroy(DestroyCallback callback);

  bool destroyed() const {
    return destroyed_;
  }

  std::size_t destroyCallbackCount() const {
    return destroyCallbacks_.size();
  }

private:
  std::vector<DestroyCallback> destroyCallbacks_{};
  bool destroyed_{false};
};

[[noreturn]] void throwNotImplemented(const char* operation);

// Handle on a bootstrapped component's host view. detectChanges() runs a pass
// on the bound instance; the other control points are not supported and throw
// NotImplementedError.
template <typename T>
class ViewRef : public ChangeDetectorRef, public DestroyRef {
public:
  ViewRef(std::function<void()> detectChanges, std::shared_ptr<T> context)
    : detectChanges_(std::move(detectChanges)),
      context_(std::move(context)) {}

  void markForCheck() override {
    throwNotImplemented("markForCheck");
  }

  void detach() override {
    throwNotImplemented("detach");
  }

  void detectChanges() override {
    if (detectChanges_) {
      detectChanges_();
    }
  }

  void checkNoChanges() override {
    throwNotImplemented("checkNoChanges");
  }

  void reattach() override {
    throwNotImplemented("reattach");
  }

  const std::shared_ptr<T>& context() const {
    return context_;
  }

private:
  std::function<void()> detectChanges_;
  std::shared_ptr<T> context_;
};

} // namespace viewhost
