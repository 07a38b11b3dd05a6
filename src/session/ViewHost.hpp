#ifndef __PT_VIEW_HOST_HPP__
#define __PT_VIEW_HOST_HPP__

#include "Headers.hpp"

namespace pt {
/**
 * @brief Identifies a process-backed view owned by the host.
 */
struct ViewHandle {
  string id;

  bool operator==(const ViewHandle& other) const { return id == other.id; }
  bool operator!=(const ViewHandle& other) const { return id != other.id; }
};

/**
 * @brief Identifies an on-screen window displaying a view.
 */
struct WindowHandle {
  int64_t id;

  bool operator==(const WindowHandle& other) const { return id == other.id; }
  bool operator!=(const WindowHandle& other) const { return id != other.id; }
};

/**
 * @brief Opaque snapshot of the host's window arrangement.
 */
struct LayoutToken {
  string state;
};

inline std::ostream& operator<<(std::ostream& os, const ViewHandle& view) {
  return os << "view:" << view.id;
}

inline std::ostream& operator<<(std::ostream& os, const WindowHandle& window) {
  return os << "window:" << window.id;
}

/**
 * @brief Host primitives the session core drives: process-backed views,
 * windows onto them and the window layout.
 *
 * Operations on a handle the host no longer knows about must be no-ops.
 */
class ViewHost {
 public:
  virtual ~ViewHost() {}

  /** @brief Returns a live view whose name matches `tagPattern`, if any. */
  virtual optional<ViewHandle> findView(const string& tagPattern) = 0;
  /** @brief Spawns `command` and binds it to a new view. */
  virtual ViewHandle createProcessView(const string& command) = 0;
  /** @brief Opens a full-screen window showing `view`. */
  virtual WindowHandle bindWindow(const ViewHandle& view) = 0;
  virtual void closeWindow(const WindowHandle& window) = 0;
  virtual bool isWindowValid(const WindowHandle& window) = 0;
  virtual bool isViewValid(const ViewHandle& view) = 0;

  virtual void setViewName(const ViewHandle& view, const string& name) = 0;
  /** @brief Hides `view` from any view listing the host offers. */
  virtual void markUnlisted(const ViewHandle& view) = 0;
  /** @brief Routes user input into the process shown by `window`. */
  virtual void focusInputMode(const WindowHandle& window) = 0;

  virtual LayoutToken captureLayout() = 0;
  virtual void applyLayout(const LayoutToken& layout) = 0;

  /** @brief Returns everything the view's process printed, one entry per
   * line. */
  virtual vector<string> readAllLines(const ViewHandle& view) = 0;
  /** @brief Discards the view, stopping its process if still running. */
  virtual void deleteView(const ViewHandle& view) = 0;

  /**
   * @brief Registers a one-shot callback fired when the process behind
   * `view` terminates.
   */
  virtual void onProcessExit(const ViewHandle& view,
                             function<void()> handler) = 0;

  /** @brief Shows a short status line to the user. */
  virtual void showMessage(const string& message) = 0;
};
}  // namespace pt

#endif  // __PT_VIEW_HOST_HPP__
