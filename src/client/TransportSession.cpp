#include "TransportSession.hpp"

namespace tether {
void TransportSession::addListener(shared_ptr<TransportListener> listener) {
  lock_guard<mutex> guard(listenerMutex);
  listeners.push_back(listener);
}

void TransportSession::removeListener(shared_ptr<TransportListener> listener) {
  lock_guard<mutex> guard(listenerMutex);
  listeners.erase(remove_if(listeners.begin(), listeners.end(),
                            [&listener](const weak_ptr<TransportListener>& it) {
                              auto locked = it.lock();
                              return !locked || locked == listener;
                            }),
                  listeners.end());
}

vector<shared_ptr<TransportListener>> TransportSession::getListeners() {
  lock_guard<mutex> guard(listenerMutex);
  vector<shared_ptr<TransportListener>> live;
  for (auto& it : listeners) {
    auto locked = it.lock();
    if (locked) {
      live.push_back(locked);
    }
  }
  return live;
}

void TransportSession::notifyOpen() {
  for (auto& it : getListeners()) {
    it->onOpen();
  }
}

void TransportSession::notifyMessage(const Message& message) {
  for (auto& it : getListeners()) {
    it->onMessage(message);
  }
}

void TransportSession::notifyDecodeFailure(const string& raw,
                                           const string& reason) {
  for (auto& it : getListeners()) {
    it->onDecodeFailure(raw, reason);
  }
}

void TransportSession::notifyError(const string& cause) {
  for (auto& it : getListeners()) {
    it->onError(cause);
  }
}

void TransportSession::notifyClose(int code, const string& reason) {
  for (auto& it : getListeners()) {
    it->onClose(code, reason);
  }
}
}  // namespace tether
