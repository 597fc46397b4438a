#pragma once

// Diagnostics checks (render context nesting, instruction misuse, bootstrap
// asserts) are compiled in when VIEWHOST_DEV_MODE is non-zero.
#ifndef VIEWHOST_DEV_MODE
#ifdef NDEBUG
#define VIEWHOST_DEV_MODE 0
#else
#define VIEWHOST_DEV_MODE 1
#endif
#endif

namespace viewhost {

inline constexpr bool devModeEnabled = VIEWHOST_DEV_MODE != 0;

} // namespace viewhost
