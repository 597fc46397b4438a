#pragma once

#include <any>
#include <memory>
#include <optional>
#include <string>

namespace viewhost {

class Injector {
public:
  virtual ~Injector() = default;

  virtual std::any get(
      const std::string& token,
      const std::optional<std::any>& notFoundValue = std::nullopt) const = 0;
};

// Placeholder module injector: every lookup throws InjectorNotFoundError, even
// when a not-found value is supplied.
class NullInjector : public Injector {
public:
  std::any get(
      const std::string& token,
      const std::optional<std::any>& notFoundValue = std::nullopt) const override;
};

std::shared_ptr<Injector> nullInjector();

} // namespace viewhost
