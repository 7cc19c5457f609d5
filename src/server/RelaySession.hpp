#ifndef __TETHER_RELAY_SESSION__
#define __TETHER_RELAY_SESSION__

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "Headers.hpp"
#include "RelayConnection.hpp"
#include "RelayProtocolHandler.hpp"

namespace tether {
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

/**
 * @brief One accepted WebSocket. All handlers run on the socket's strand;
 * send() and close() may be called from any thread.
 */
class RelaySession : public RelayConnection,
                     public enable_shared_from_this<RelaySession> {
 public:
  static const size_t MAX_FRAME_BYTES = 1024 * 1024;

  RelaySession(tcp::socket&& socket,
               shared_ptr<RelayProtocolHandler> _handler,
               chrono::seconds _authDeadline);

  /**
   * @brief Completes the upgrade for an already-read HTTP request.
   */
  void run(http::request<http::string_body> upgradeRequest,
           const string& upgradeToken);

  const string& getId() const override { return id; }

  const string& getPeerAddress() const override { return peerAddress; }

  void send(const string& frame) override;

  void close(int code, const string& reason) override;

 protected:
  void onAccept(beast::error_code ec);
  void doRead();
  void onRead(beast::error_code ec, size_t bytesTransferred);
  void doWrite();
  void onWrite(beast::error_code ec, size_t bytesTransferred);
  void doClose();
  void onAuthDeadline(beast::error_code ec);
  void handleDisconnect(const string& why);

  websocket::stream<beast::tcp_stream> ws;
  beast::flat_buffer buffer;
  net::steady_timer authTimer;
  shared_ptr<RelayProtocolHandler> handler;
  chrono::seconds authDeadline;
  string id;
  string peerAddress;
  string upgradeToken;

  // Strand state
  deque<shared_ptr<string>> outbox;
  bool writeInProgress;
  bool closeRequested;
  bool closeStarted;
  bool disconnected;
  websocket::close_reason closeReason;
};
}  // namespace tether

#endif  // __TETHER_RELAY_SESSION__
