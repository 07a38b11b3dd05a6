#include "SessionRegistry.hpp"

namespace pt {
void SessionRegistry::registerSessions(const vector<SessionConfig>& configs) {
  set<string> incoming;
  for (const auto& config : configs) {
    if (config.name.empty()) {
      throw std::runtime_error("Session name cannot be empty");
    }
    if (has(config.name) || !incoming.insert(config.name).second) {
      LOG(ERROR) << "Session configured twice: " << config.name;
      throw DuplicateNameError(config.name);
    }
  }

  for (const auto& config : configs) {
    sessions.insert(
        make_pair(config.name, shared_ptr<SessionRecord>(
                                   new SessionRecord(config))));
    LOG(INFO) << "Registered session " << config.name << " (tag "
              << config.viewTag << ")";
  }
}

shared_ptr<SessionRecord> SessionRegistry::get(const string& name) const {
  auto it = sessions.find(name);
  if (it == sessions.end()) {
    throw UnknownSessionError(name);
  }
  return it->second;
}

vector<string> SessionRegistry::names() const {
  vector<string> retval;
  for (const auto& it : sessions) {
    retval.push_back(it.first);
  }
  return retval;
}

void SessionRegistry::forEach(
    const function<void(SessionRecord&)>& visitor) const {
  for (const auto& it : sessions) {
    visitor(*(it.second));
  }
}
}  // namespace pt
