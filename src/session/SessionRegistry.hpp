#ifndef __PT_SESSION_REGISTRY__
#define __PT_SESSION_REGISTRY__

#include "SessionErrors.hpp"
#include "SessionRecord.hpp"

namespace pt {
/**
 * @brief Owns one `SessionRecord` per configured session, keyed by name.
 *
 * Records are created at setup and live as long as the registry.
 */
class SessionRegistry {
 public:
  SessionRegistry() {}

  /**
   * @brief Adds a record per config entry.
   *
   * All names are validated first, so a `DuplicateNameError` leaves the
   * registry untouched.
   */
  void registerSessions(const vector<SessionConfig>& configs);

  /** @brief Returns the record for `name` or throws `UnknownSessionError`. */
  shared_ptr<SessionRecord> get(const string& name) const;

  inline bool has(const string& name) const {
    return sessions.find(name) != sessions.end();
  }

  inline int size() const { return int(sessions.size()); }

  /** @brief Sorted session names. */
  vector<string> names() const;

  void forEach(const function<void(SessionRecord&)>& visitor) const;

 protected:
  map<string, shared_ptr<SessionRecord>> sessions;
};
}  // namespace pt

#endif  // __PT_SESSION_REGISTRY__
