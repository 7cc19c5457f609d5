#ifndef __TETHER_WEBSOCKET_TRANSPORT_SESSION__
#define __TETHER_WEBSOCKET_TRANSPORT_SESSION__

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include "Headers.hpp"
#include "TransportSession.hpp"

namespace tether {
class WebSocketLink;

/**
 * @brief TransportSession over Boost.Beast. Owns one I/O thread; every
 * connect attempt gets a fresh link so that events from an abandoned socket
 * never reach the listeners.
 */
class WebSocketTransportSession : public TransportSession {
 public:
  explicit WebSocketTransportSession(
      chrono::milliseconds _connectTimeout =
          chrono::seconds(CLIENT_CONNECT_TIMEOUT_SECONDS));

  virtual ~WebSocketTransportSession();

  bool connect(const ConnectionDescriptor& descriptor) override;

  bool send(const Message& message) override;

  void disconnect() override;

  bool isOpen() override;

  // Called by links on the I/O thread.
  void onLinkOpen(WebSocketLink* source);
  void onLinkFrame(WebSocketLink* source, const string& frame);
  void onLinkFailed(WebSocketLink* source, const string& cause);
  void onLinkClosed(WebSocketLink* source, int code, const string& reason);

 protected:
  shared_ptr<WebSocketLink> createLink(const ConnectionDescriptor& descriptor);
  void resolveOpen(bool opened);

  boost::asio::io_context ioc;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
      workGuard;
  boost::asio::ssl::context sslContext;
  shared_ptr<thread> ioThread;
  chrono::milliseconds connectTimeout;

  recursive_mutex classMutex;
  shared_ptr<WebSocketLink> link;
  shared_ptr<promise<bool>> openPromise;
  bool connecting;
  bool open;
};
}  // namespace tether

#endif  // __TETHER_WEBSOCKET_TRANSPORT_SESSION__
