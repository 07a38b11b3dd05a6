#ifndef __PT_SESSION_CONTROLLER__
#define __PT_SESSION_CONTROLLER__

#include "ExitCallbackDispatcher.hpp"
#include "LayoutManager.hpp"
#include "SessionRegistry.hpp"
#include "ViewHost.hpp"

namespace pt {
/**
 * @brief Drives every session through idle, hidden and visible.
 *
 * `toggle()` shows or hides one session at a time (showing a session hides
 * every other one), processes survive hide/show cycles, and a process that
 * exits on its own hands its output to the session's exit callback before
 * its view is discarded.
 *
 * The controller registers exit watchers that refer back to it, so it must
 * outlive any pending notifications from the host.
 */
class SessionController {
 public:
  SessionController(shared_ptr<SessionRegistry> _registry,
                    shared_ptr<ViewHost> _host);

  /**
   * @brief Hides the session if it is visible, otherwise shows it (launching
   * its process first if needed).
   *
   * Throws `UnknownSessionError` for an unregistered name. When no launch
   * command can be resolved the call returns without changing the session.
   */
  void toggle(const string& name);

  /** @brief Hides every visible session except `except`. Processes keep
   * running. */
  void closeOthers(const string& except);

  /**
   * @brief Exit watcher entry point: the process behind `view` ended.
   *
   * Ignored unless `view` is still the session's current view.
   */
  void handleProcessExit(const string& name, const ViewHandle& view);

  SessionState getState(const string& name) const;

  /** @brief Snapshot of every session for diagnostics. */
  string toJsonString() const;

  inline shared_ptr<SessionRegistry> getRegistry() { return registry; }

 protected:
  shared_ptr<SessionRegistry> registry;
  shared_ptr<ViewHost> host;
  LayoutManager layoutManager;
  ExitCallbackDispatcher dispatcher;

  /**
   * @brief Closes the session's window and restores the layout saved before
   * it opened. `programExited` records why in `session.exited`.
   */
  void closeWindow(SessionRecord& session, bool programExited);

  void showView(SessionRecord& session, const ViewHandle& view);

  /** @return false when there was nothing to launch. */
  bool launch(SessionRecord& session);

  /** @brief Routes the end of `view`'s process to `handleProcessExit`. */
  void watchProcessExit(SessionRecord& session, const ViewHandle& view);

  /**
   * @brief Looks `viewTag` up in the host, skipping views that another
   * session already owns.
   */
  optional<ViewHandle> findUnclaimedView(const string& name,
                                         const string& viewTag);
};
}  // namespace pt

#endif  // __PT_SESSION_CONTROLLER__
