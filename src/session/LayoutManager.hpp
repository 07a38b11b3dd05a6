#ifndef __PT_LAYOUT_MANAGER__
#define __PT_LAYOUT_MANAGER__

#include "SessionRecord.hpp"
#include "ViewHost.hpp"

namespace pt {
/**
 * @brief Saves the window arrangement before a session goes full-screen and
 * puts it back when that session's window closes.
 */
class LayoutManager {
 public:
  explicit LayoutManager(shared_ptr<ViewHost> _host) : host(_host) {}

  /** @brief Stores the host's current layout in `session.savedLayout`. */
  void capture(SessionRecord& session);

  /** @brief Re-applies `session.savedLayout`; no-op when nothing was saved.
   */
  void restore(SessionRecord& session);

 protected:
  shared_ptr<ViewHost> host;
};
}  // namespace pt

#endif  // __PT_LAYOUT_MANAGER__
