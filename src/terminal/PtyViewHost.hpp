#ifndef __PT_PTY_VIEW_HOST__
#define __PT_PTY_VIEW_HOST__

#include "Console.hpp"
#include "PtyProcess.hpp"
#include "ViewHost.hpp"

namespace pt {
/**
 * @brief `ViewHost` over the local console: every view is a `PtyProcess`
 * and windows stack full-screen on the console, the top one visible.
 *
 * Not thread safe; `update()` and user actions must come from one loop,
 * which also serializes exit notifications with toggles.
 */
class PtyViewHost : public ViewHost {
 protected:
  struct View;

 public:
  explicit PtyViewHost(shared_ptr<Console> _console);
  virtual ~PtyViewHost();

  virtual optional<ViewHandle> findView(const string& tagPattern);
  virtual ViewHandle createProcessView(const string& command);
  virtual WindowHandle bindWindow(const ViewHandle& view);
  virtual void closeWindow(const WindowHandle& window);
  virtual bool isWindowValid(const WindowHandle& window);
  virtual bool isViewValid(const ViewHandle& view);
  virtual void setViewName(const ViewHandle& view, const string& name);
  virtual void markUnlisted(const ViewHandle& view);
  virtual void focusInputMode(const WindowHandle& window);
  virtual LayoutToken captureLayout();
  virtual void applyLayout(const LayoutToken& layout);
  virtual vector<string> readAllLines(const ViewHandle& view);
  virtual void deleteView(const ViewHandle& view);
  virtual void onProcessExit(const ViewHandle& view, function<void()> handler);
  virtual void showMessage(const string& message);

  /** @brief Pty descriptors of every running view, for select(). */
  vector<int> getViewFds();
  /**
   * @brief Drains the views whose fds are in `readyFds`, mirrors the
   * foreground view onto the console and fires exit handlers of processes
   * that ended.
   */
  void update(const set<int>& readyFds);
  /** @brief Sends keystrokes to the focused window's process. */
  void writeToForeground(const string& data);
  /** @brief Re-applies the console size to the foreground view. */
  void refreshSize();
  /** @brief Kills every process. Exit handlers do not fire. */
  void shutdown();

  optional<WindowHandle> getForegroundWindow();
  inline bool isInputFocused() { return inputFocused; }
  /** @brief Names of the views that were not marked unlisted. */
  vector<string> listViews();
  inline const string& getLastMessage() { return lastMessage; }
  inline int numViews() { return int(views.size()); }

 protected:
  shared_ptr<Console> console;
  map<string, shared_ptr<View>> views;
  /** @brief Open windows, bottom to top. */
  vector<pair<WindowHandle, ViewHandle>> windowStack;
  int64_t nextWindowId;
  bool inputFocused;
  bool alternateScreen;
  string lastMessage;

  shared_ptr<View> getView(const ViewHandle& view);
  void drawForeground();
  void leaveAlternateScreen();
};
}  // namespace pt

#endif  // __PT_PTY_VIEW_HOST__
