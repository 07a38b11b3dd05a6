#include "LayoutManager.hpp"

namespace pt {
void LayoutManager::capture(SessionRecord& session) {
  session.savedLayout = host->captureLayout();
  VLOG(1) << "Captured layout for " << session.name;
}

void LayoutManager::restore(SessionRecord& session) {
  if (!session.savedLayout) {
    LOG(INFO) << "No saved layout to restore for " << session.name;
    return;
  }
  host->applyLayout(*session.savedLayout);
  session.savedLayout.reset();
  VLOG(1) << "Restored layout for " << session.name;
}
}  // namespace pt
