#include "RelaySession.hpp"

namespace tether {
RelaySession::RelaySession(tcp::socket&& socket,
                           shared_ptr<RelayProtocolHandler> _handler,
                           chrono::seconds _authDeadline)
    : ws(std::move(socket)),
      authTimer(ws.get_executor()),
      handler(_handler),
      authDeadline(_authDeadline),
      id(sole::uuid4().str()),
      peerAddress("unknown"),
      writeInProgress(false),
      closeRequested(false),
      closeStarted(false),
      disconnected(false) {
  beast::error_code ec;
  auto endpoint = beast::get_lowest_layer(ws).socket().remote_endpoint(ec);
  if (!ec) {
    peerAddress =
        endpoint.address().to_string() + ":" + to_string(endpoint.port());
  }
}

void RelaySession::run(http::request<http::string_body> upgradeRequest,
                       const string& _upgradeToken) {
  upgradeToken = _upgradeToken;
  beast::get_lowest_layer(ws).expires_never();
  ws.set_option(
      websocket::stream_base::timeout::suggested(beast::role_type::server));
  ws.set_option(websocket::stream_base::decorator(
      [](websocket::response_type& res) {
        res.set(http::field::server, string("tetherserver/") + TETHER_VERSION);
      }));
  ws.read_message_max(MAX_FRAME_BYTES);
  ws.async_accept(upgradeRequest, beast::bind_front_handler(
                                      &RelaySession::onAccept,
                                      shared_from_this()));
}

void RelaySession::onAccept(beast::error_code ec) {
  if (ec) {
    LOG(WARNING) << "WebSocket accept from " << peerAddress
                 << " failed: " << ec.message();
    return;
  }
  handler->onConnectionOpened(shared_from_this(), upgradeToken);
  authTimer.expires_after(authDeadline);
  authTimer.async_wait(beast::bind_front_handler(&RelaySession::onAuthDeadline,
                                                 shared_from_this()));
  doRead();
}

void RelaySession::onAuthDeadline(beast::error_code ec) {
  if (ec == net::error::operation_aborted || disconnected) {
    return;
  }
  handler->onAuthDeadline(shared_from_this());
}

void RelaySession::doRead() {
  ws.async_read(buffer, beast::bind_front_handler(&RelaySession::onRead,
                                                  shared_from_this()));
}

void RelaySession::onRead(beast::error_code ec, size_t bytesTransferred) {
  if (ec == websocket::error::closed) {
    handleDisconnect("closed by peer (" + to_string(int(ws.reason().code)) +
                     ")");
    return;
  }
  if (ec) {
    handleDisconnect(ec.message());
    return;
  }
  if (!ws.got_text()) {
    buffer.consume(buffer.size());
    LOG(WARNING) << "Binary frame from " << id << " treated as malformed";
    handler->onFrame(shared_from_this(), string());
    doRead();
    return;
  }
  string frame = beast::buffers_to_string(buffer.data());
  buffer.consume(buffer.size());
  handler->onFrame(shared_from_this(), frame);
  if (handler->getRegistry()->isAuthenticated(id)) {
    authTimer.cancel();
  }
  doRead();
}

void RelaySession::send(const string& frame) {
  auto message = make_shared<string>(frame);
  net::dispatch(ws.get_executor(),
                [self = shared_from_this(), message]() {
                  if (self->closeRequested || self->disconnected) {
                    return;
                  }
                  self->outbox.push_back(message);
                  if (!self->writeInProgress) {
                    self->writeInProgress = true;
                    self->doWrite();
                  }
                });
}

void RelaySession::close(int code, const string& reason) {
  net::dispatch(ws.get_executor(), [self = shared_from_this(), code,
                                    reason]() {
    if (self->closeRequested || self->disconnected) {
      return;
    }
    self->closeRequested = true;
    self->closeReason = websocket::close_reason(
        static_cast<std::uint16_t>(code), beast::string_view(reason));
    if (!self->writeInProgress) {
      self->doClose();
    }
  });
}

void RelaySession::doWrite() {
  if (outbox.empty()) {
    writeInProgress = false;
    if (closeRequested) {
      doClose();
    }
    return;
  }
  auto message = outbox.front();
  ws.text(true);
  ws.async_write(net::buffer(*message),
                 [self = shared_from_this(), message](beast::error_code ec,
                                                      size_t bytes) {
                   self->onWrite(ec, bytes);
                 });
}

void RelaySession::onWrite(beast::error_code ec, size_t bytesTransferred) {
  if (ec) {
    LOG(WARNING) << "Write to " << id << " failed: " << ec.message();
    outbox.clear();
    writeInProgress = false;
    return;
  }
  outbox.pop_front();
  doWrite();
}

void RelaySession::doClose() {
  if (closeStarted || disconnected) {
    return;
  }
  closeStarted = true;
  VLOG(1) << "Closing " << id << " with code " << int(closeReason.code);
  ws.async_close(closeReason, [self = shared_from_this()](beast::error_code ec) {
    if (ec) {
      VLOG(1) << "Close of " << self->id << " finished with " << ec.message();
    }
  });
}

void RelaySession::handleDisconnect(const string& why) {
  if (disconnected) {
    return;
  }
  disconnected = true;
  authTimer.cancel();
  outbox.clear();
  LOG(INFO) << "Connection " << id << " from " << peerAddress
            << " disconnected: " << why;
  handler->onConnectionClosed(id);
}
}  // namespace tether
