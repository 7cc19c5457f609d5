#include "SessionRegistry.hpp"

namespace tether {
void SessionRegistry::addConnection(shared_ptr<RelayConnection> connection,
                                    const string& upgradeToken) {
  lock_guard<recursive_mutex> guard(classMutex);
  const string& id = connection->getId();
  if (connections.find(id) != connections.end()) {
    STFATAL << "Duplicate connection id: " << id;
  }
  ConnectionState state;
  state.connection = connection;
  state.upgradeToken = upgradeToken;
  state.connectedAtMs = currentTimeMillis();
  connections[id] = state;
  LOG(INFO) << "Registered connection " << id << " from "
            << connection->getPeerAddress();
}

bool SessionRegistry::hasConnection(const string& connectionId) {
  lock_guard<recursive_mutex> guard(classMutex);
  return connections.find(connectionId) != connections.end();
}

bool SessionRegistry::isAuthenticated(const string& connectionId) {
  lock_guard<recursive_mutex> guard(classMutex);
  auto it = connections.find(connectionId);
  return it != connections.end() && it->second.sessionId.has_value();
}

string SessionRegistry::getUpgradeToken(const string& connectionId) {
  lock_guard<recursive_mutex> guard(classMutex);
  auto it = connections.find(connectionId);
  return it == connections.end() ? string() : it->second.upgradeToken;
}

optional<string> SessionRegistry::authenticate(const string& connectionId,
                                               const ClientInfo& clientInfo) {
  lock_guard<recursive_mutex> guard(classMutex);
  auto it = connections.find(connectionId);
  if (it == connections.end()) {
    LOG(WARNING) << "Tried to authenticate unknown connection "
                 << connectionId;
    return nullopt;
  }
  if (it->second.sessionId) {
    return nullopt;
  }
  string sessionId = sole::uuid4().str();
  it->second.sessionId = sessionId;
  it->second.clientInfo = clientInfo;
  it->second.authenticatedAtMs = currentTimeMillis();
  // The token has done its job.
  it->second.upgradeToken.clear();
  LOG(INFO) << "Connection " << connectionId << " authenticated as session "
            << sessionId << " (" << clientInfo.platform << " "
            << clientInfo.version << ")";
  return sessionId;
}

optional<string> SessionRegistry::getSessionId(const string& connectionId) {
  lock_guard<recursive_mutex> guard(classMutex);
  auto it = connections.find(connectionId);
  if (it == connections.end()) {
    return nullopt;
  }
  return it->second.sessionId;
}

int SessionRegistry::recordMalformedFrame(const string& connectionId) {
  lock_guard<recursive_mutex> guard(classMutex);
  auto it = connections.find(connectionId);
  if (it == connections.end()) {
    return 0;
  }
  return ++it->second.malformedFrames;
}

bool SessionRegistry::beginExecution(const string& connectionId,
                                     shared_ptr<CommandExecution> execution) {
  lock_guard<recursive_mutex> guard(classMutex);
  auto it = connections.find(connectionId);
  if (it == connections.end() || !it->second.sessionId) {
    return false;
  }
  if (it->second.execution && !it->second.execution->isSettled()) {
    return false;
  }
  it->second.execution = execution;
  return true;
}

void SessionRegistry::endExecution(
    const string& connectionId,
    const shared_ptr<CommandExecution>& execution) {
  lock_guard<recursive_mutex> guard(classMutex);
  auto it = connections.find(connectionId);
  if (it != connections.end() && it->second.execution == execution) {
    it->second.execution.reset();
  }
}

shared_ptr<CommandExecution> SessionRegistry::getExecution(
    const string& connectionId) {
  lock_guard<recursive_mutex> guard(classMutex);
  auto it = connections.find(connectionId);
  if (it == connections.end() || !it->second.execution ||
      it->second.execution->isSettled()) {
    return shared_ptr<CommandExecution>();
  }
  return it->second.execution;
}

void SessionRegistry::removeConnection(const string& connectionId) {
  shared_ptr<CommandExecution> execution;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    auto it = connections.find(connectionId);
    if (it == connections.end()) {
      return;
    }
    execution = it->second.execution;
    LOG(INFO) << "Removing connection " << connectionId
              << (it->second.sessionId
                      ? " (session " + *it->second.sessionId + ")"
                      : string(" (unauthenticated)"));
    connections.erase(it);
  }
  if (execution) {
    execution->cancel();
  }
}

vector<SessionSnapshot> SessionRegistry::listSessions() {
  lock_guard<recursive_mutex> guard(classMutex);
  vector<SessionSnapshot> snapshots;
  for (const auto& it : connections) {
    const ConnectionState& state = it.second;
    SessionSnapshot snapshot;
    snapshot.connectionId = it.first;
    snapshot.sessionId = state.sessionId.value_or("");
    snapshot.peerAddress = state.connection->getPeerAddress();
    snapshot.platform = state.clientInfo.platform;
    snapshot.clientVersion = state.clientInfo.version;
    snapshot.connectedAtMs = state.connectedAtMs;
    snapshot.authenticatedAtMs = state.authenticatedAtMs;
    snapshot.authenticated = state.sessionId.has_value();
    if (state.execution && !state.execution->isSettled()) {
      snapshot.executing = true;
      snapshot.runningCommand = state.execution->describe();
      snapshot.runningRequestId = state.execution->getRequestId();
    }
    snapshots.push_back(snapshot);
  }
  sort(snapshots.begin(), snapshots.end(),
       [](const SessionSnapshot& a, const SessionSnapshot& b) {
         return a.connectedAtMs < b.connectedAtMs;
       });
  return snapshots;
}

int SessionRegistry::countAuthenticated() {
  lock_guard<recursive_mutex> guard(classMutex);
  int count = 0;
  for (const auto& it : connections) {
    if (it.second.sessionId) {
      count++;
    }
  }
  return count;
}

int SessionRegistry::countPending() {
  lock_guard<recursive_mutex> guard(classMutex);
  return int(connections.size()) - countAuthenticated();
}

void SessionRegistry::shutdown(chrono::milliseconds grace) {
  vector<shared_ptr<CommandExecution>> executions;
  vector<shared_ptr<RelayConnection>> sockets;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    for (auto& it : connections) {
      if (it.second.execution) {
        executions.push_back(it.second.execution);
      }
      sockets.push_back(it.second.connection);
    }
    connections.clear();
  }
  LOG(INFO) << "Shutting down " << sockets.size() << " connections and "
            << executions.size() << " executions";
  for (auto& execution : executions) {
    execution->cancel();
  }
  for (auto& socket : sockets) {
    socket->close(CLOSE_GOING_AWAY, "server shutting down");
  }
  for (auto& execution : executions) {
    if (!execution->waitFor(grace)) {
      LOG(WARNING) << "Execution " << execution->getId()
                   << " did not stop within the grace period";
    }
  }
}
}  // namespace tether
