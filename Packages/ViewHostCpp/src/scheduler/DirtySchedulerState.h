#pragma once

#include <cstdint>

namespace viewhost {

struct DirtySchedulerState {
  // Set when markDirty hands a pass to a scheduler, cleared by the next
  // detection pass that completes, whichever pass that is.
  bool isDirty{false};
  std::uint64_t scheduledPassCount{0};
  std::uint64_t completedPassCount{0};
};

} // namespace viewhost
