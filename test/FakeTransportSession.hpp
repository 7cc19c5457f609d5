#ifndef __TETHER_FAKE_TRANSPORT_SESSION__
#define __TETHER_FAKE_TRANSPORT_SESSION__

#include "TestHeaders.hpp"
#include "TransportSession.hpp"

namespace tether {
/**
 * @brief In-memory transport. Sent messages are recorded and handed to an
 * optional responder that plays the relay.
 */
class FakeTransportSession : public TransportSession {
 public:
  typedef function<void(FakeTransportSession*, const Message&)> Responder;

  FakeTransportSession() : reachable(true), open(false), connectCalls(0) {}

  bool connect(const ConnectionDescriptor& descriptor) override {
    {
      lock_guard<recursive_mutex> guard(classMutex);
      connectCalls++;
      lastDescriptor = descriptor;
      if (!reachable) {
        open = false;
      } else {
        open = true;
      }
    }
    if (!reachable) {
      notifyError("Connection refused");
      return false;
    }
    notifyOpen();
    return true;
  }

  bool send(const Message& message) override {
    Responder currentResponder;
    {
      lock_guard<recursive_mutex> guard(classMutex);
      if (!open) {
        return false;
      }
      sent.push_back(message);
      currentResponder = responder;
    }
    if (currentResponder) {
      currentResponder(this, message);
    }
    return true;
  }

  void disconnect() override {
    bool wasOpen;
    {
      lock_guard<recursive_mutex> guard(classMutex);
      wasOpen = open;
      open = false;
    }
    if (wasOpen) {
      notifyClose(1000, "Client disconnect");
    }
  }

  bool isOpen() override {
    lock_guard<recursive_mutex> guard(classMutex);
    return open;
  }

  // Relay side.
  void deliver(const Message& message) { notifyMessage(message); }

  void deliverGarbage(const string& raw) {
    notifyDecodeFailure(raw, "frame is not valid json");
  }

  void dropConnection(int code, const string& reason) {
    {
      lock_guard<recursive_mutex> guard(classMutex);
      open = false;
    }
    notifyClose(code, reason);
  }

  void setReachable(bool value) {
    lock_guard<recursive_mutex> guard(classMutex);
    reachable = value;
  }

  void setResponder(Responder value) {
    lock_guard<recursive_mutex> guard(classMutex);
    responder = value;
  }

  vector<Message> getSent() {
    lock_guard<recursive_mutex> guard(classMutex);
    return sent;
  }

  int getConnectCalls() {
    lock_guard<recursive_mutex> guard(classMutex);
    return connectCalls;
  }

 protected:
  recursive_mutex classMutex;
  bool reachable;
  bool open;
  int connectCalls;
  optional<ConnectionDescriptor> lastDescriptor;
  vector<Message> sent;
  Responder responder;
};
}  // namespace tether

#endif  // __TETHER_FAKE_TRANSPORT_SESSION__
