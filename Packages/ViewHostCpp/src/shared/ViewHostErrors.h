#pragma once

#include <stdexcept>
#include <string>

namespace viewhost {

// The host surface for a bootstrap could not be found.
class HostResolutionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Change detection or a host lookup was attempted on a value that was never
// bootstrapped by the runtime it was handed to.
class NotAHostInstanceError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

class NotImplementedError : public std::logic_error {
public:
  NotImplementedError() : std::logic_error("NotImplemented") {}
  explicit NotImplementedError(const std::string& message) : std::logic_error(message) {}
};

// leaveView was called with a context other than the one returned by the
// innermost enterView.
class ContextNestingError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

class AssertionError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

class InjectorNotFoundError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace viewhost
