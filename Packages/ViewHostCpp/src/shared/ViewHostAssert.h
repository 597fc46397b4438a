#pragma once

#include "shared/ViewHostErrors.h"

#include <memory>
#include <string>

namespace viewhost {

inline void assertNotNull(const void* value, const char* name) {
  if (value == nullptr) {
    throw AssertionError(std::string("assertion failed: ") + name + " must be defined");
  }
}

template <typename T>
inline void assertNotNull(const std::shared_ptr<T>& value, const char* name) {
  assertNotNull(static_cast<const void*>(value.get()), name);
}

inline void assertTrue(bool condition, const std::string& message) {
  if (!condition) {
    throw AssertionError("assertion failed: " + message);
  }
}

} // namespace viewhost
