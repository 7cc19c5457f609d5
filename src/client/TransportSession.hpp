#ifndef __TETHER_TRANSPORT_SESSION__
#define __TETHER_TRANSPORT_SESSION__

#include "ConnectionDescriptor.hpp"
#include "Headers.hpp"
#include "Message.hpp"

namespace tether {
/**
 * @brief Receives transport events. All callbacks for one session arrive on
 * that session's I/O thread, in receive order.
 */
class TransportListener {
 public:
  virtual ~TransportListener() {}

  virtual void onOpen() {}

  virtual void onMessage(const Message& message) = 0;

  /**
   * @brief A frame that could not be decoded. The session stays open.
   */
  virtual void onDecodeFailure(const string& raw, const string& reason) {}

  virtual void onError(const string& cause) {}

  virtual void onClose(int code, const string& reason) {}
};

/**
 * @brief One client-side socket to a relay host.
 */
class TransportSession {
 public:
  virtual ~TransportSession() {}

  /**
   * @brief Opens the socket and completes the WebSocket handshake. Blocks
   * until the socket is open, fails or the connect timeout passes.
   * @return false immediately if a connect is already in flight.
   */
  virtual bool connect(const ConnectionDescriptor& descriptor) = 0;

  /**
   * @brief Queues `message`.
   * @return false if the socket is not open.
   */
  virtual bool send(const Message& message) = 0;

  /**
   * @brief Closes with a normal closure if open. Safe from any thread and in
   * any state.
   */
  virtual void disconnect() = 0;

  virtual bool isOpen() = 0;

  void addListener(shared_ptr<TransportListener> listener);

  void removeListener(shared_ptr<TransportListener> listener);

 protected:
  vector<shared_ptr<TransportListener>> getListeners();

  void notifyOpen();
  void notifyMessage(const Message& message);
  void notifyDecodeFailure(const string& raw, const string& reason);
  void notifyError(const string& cause);
  void notifyClose(int code, const string& reason);

  mutex listenerMutex;
  vector<weak_ptr<TransportListener>> listeners;
};
}  // namespace tether

#endif  // __TETHER_TRANSPORT_SESSION__
