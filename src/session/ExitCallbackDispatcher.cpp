#include "ExitCallbackDispatcher.hpp"

namespace pt {
bool ExitCallbackDispatcher::dispatch(SessionRecord& session,
                                      const vector<string>& lines) {
  if (!session.exited) {
    STERROR << "Exit dispatch for " << session.name
            << " which did not exit on its own";
    return true;
  }
  if (!session.onExit) {
    VLOG(1) << "No exit callback for " << session.name;
    return true;
  }
  LOG(INFO) << "Dispatching " << lines.size() << " lines to exit callback of "
            << session.name;
  try {
    session.onExit(lines);
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Exit callback for " << session.name
               << " failed: " << ex.what();
    return false;
  } catch (...) {
    LOG(ERROR) << "Exit callback for " << session.name
               << " threw a non-standard exception";
    return false;
  }
  return true;
}
}  // namespace pt
