#include "WebSocketTransportSession.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "MessageCodec.hpp"
#include "PairingUri.hpp"

namespace tether {
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {
typedef websocket::stream<beast::tcp_stream> PlainStream;
typedef websocket::stream<beast::ssl_stream<beast::tcp_stream>> SecureStream;

const size_t MAX_FRAME_BYTES = 1024 * 1024;
const chrono::milliseconds CLOSE_LINGER(500);

template <class Handler>
void startTls(PlainStream& ws, const string& host, Handler handler) {
  net::post(ws.get_executor(),
            [handler]() mutable { handler(beast::error_code()); });
}

template <class Handler>
void startTls(SecureStream& ws, const string& host, Handler handler) {
  // SNI
  if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(),
                                host.c_str())) {
    beast::error_code ec(static_cast<int>(::ERR_get_error()),
                         net::error::get_ssl_category());
    net::post(ws.get_executor(), [handler, ec]() mutable { handler(ec); });
    return;
  }
  ws.next_layer().set_verify_callback(net::ssl::host_name_verification(host));
  ws.next_layer().async_handshake(net::ssl::stream_base::client, handler);
}
}  // namespace

/**
 * @brief One socket attempt. Handlers run on the link's strand.
 */
class WebSocketLink {
 public:
  virtual ~WebSocketLink() {}

  virtual void start() = 0;

  virtual void send(shared_ptr<string> frame) = 0;

  /**
   * @brief Normal closure if open, otherwise abandons the attempt.
   */
  virtual void close() = 0;

  virtual void abort() = 0;
};

template <class Stream>
class BasicWebSocketLink
    : public WebSocketLink,
      public enable_shared_from_this<BasicWebSocketLink<Stream>> {
 public:
  template <class... Args>
  BasicWebSocketLink(WebSocketTransportSession* _owner,
                     const ConnectionDescriptor& descriptor,
                     chrono::milliseconds _connectTimeout, Args&&... args)
      : owner(_owner),
        ws(std::forward<Args>(args)...),
        resolver(ws.get_executor()),
        host(descriptor.getHost()),
        port(descriptor.getPort()),
        target(RELAY_WS_PATH + "?key=" +
               PairingUri::percentEncode(descriptor.getSessionToken())),
        connectTimeout(_connectTimeout),
        opened(false),
        writing(false),
        closeRequested(false),
        finished(false) {}

  void start() override {
    auto self = this->shared_from_this();
    net::dispatch(ws.get_executor(), [self]() {
      self->resolver.async_resolve(
          self->host, to_string(self->port),
          [self](beast::error_code ec, tcp::resolver::results_type results) {
            self->onResolve(ec, results);
          });
    });
  }

  void send(shared_ptr<string> frame) override {
    auto self = this->shared_from_this();
    net::post(ws.get_executor(), [self, frame]() {
      if (self->finished || self->closeRequested) {
        return;
      }
      self->outbox.push_back(frame);
      if (!self->writing) {
        self->doWrite();
      }
    });
  }

  void close() override {
    auto self = this->shared_from_this();
    net::post(ws.get_executor(), [self]() {
      if (self->finished || self->closeRequested) {
        return;
      }
      if (!self->opened) {
        self->doAbort();
        return;
      }
      self->closeRequested = true;
      if (!self->writing) {
        self->doClose();
      }
    });
  }

  void abort() override {
    auto self = this->shared_from_this();
    net::post(ws.get_executor(), [self]() { self->doAbort(); });
  }

 protected:
  void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) {
      fail("Cannot resolve " + host + ": " + ec.message());
      return;
    }
    auto self = this->shared_from_this();
    beast::get_lowest_layer(ws).expires_after(connectTimeout);
    beast::get_lowest_layer(ws).async_connect(
        results, [self](beast::error_code ec, tcp::endpoint endpoint) {
          self->onConnect(ec, endpoint);
        });
  }

  void onConnect(beast::error_code ec, tcp::endpoint endpoint) {
    if (ec) {
      fail("Cannot connect to " + host + ":" + to_string(port) + ": " +
           ec.message());
      return;
    }
    VLOG(1) << "TCP connected to " << endpoint;
    auto self = this->shared_from_this();
    startTls(ws, host, [self](beast::error_code ec) { self->onTls(ec); });
  }

  void onTls(beast::error_code ec) {
    if (ec) {
      fail("TLS handshake failed: " + ec.message());
      return;
    }
    string hostHeader = host.find(':') == string::npos ? host : "[" + host + "]";
    hostHeader += ":" + to_string(port);
    ws.set_option(websocket::stream_base::decorator(
        [](websocket::request_type& req) {
          req.set(beast::http::field::user_agent,
                  string("tether/") + TETHER_VERSION);
        }));
    ws.read_message_max(MAX_FRAME_BYTES);
    auto self = this->shared_from_this();
    ws.async_handshake(hostHeader, target,
                       [self](beast::error_code ec) { self->onHandshake(ec); });
  }

  void onHandshake(beast::error_code ec) {
    if (ec) {
      fail("WebSocket handshake failed: " + ec.message());
      return;
    }
    beast::get_lowest_layer(ws).expires_never();
    ws.set_option(
        websocket::stream_base::timeout::suggested(beast::role_type::client));
    opened = true;
    owner->onLinkOpen(this);
    doRead();
  }

  void doRead() {
    auto self = this->shared_from_this();
    ws.async_read(buffer, [self](beast::error_code ec, size_t bytes) {
      self->onRead(ec, bytes);
    });
  }

  void onRead(beast::error_code ec, size_t bytesTransferred) {
    if (ec == websocket::error::closed) {
      finished = true;
      owner->onLinkClosed(this, int(ws.reason().code),
                          string(ws.reason().reason.c_str()));
      return;
    }
    if (ec) {
      fail(ec.message());
      return;
    }
    if (!ws.got_text()) {
      VLOG(1) << "Dropping binary frame of " << bytesTransferred << " bytes";
      buffer.consume(buffer.size());
      doRead();
      return;
    }
    string frame = beast::buffers_to_string(buffer.data());
    buffer.consume(buffer.size());
    owner->onLinkFrame(this, frame);
    doRead();
  }

  void doWrite() {
    writing = true;
    ws.text(true);
    auto self = this->shared_from_this();
    ws.async_write(net::buffer(*outbox.front()),
                   [self](beast::error_code ec, size_t bytes) {
                     self->onWrite(ec, bytes);
                   });
  }

  void onWrite(beast::error_code ec, size_t bytesTransferred) {
    writing = false;
    if (ec) {
      // The pending read reports the failure.
      LOG(WARNING) << "WebSocket write failed: " << ec.message();
      outbox.clear();
      return;
    }
    outbox.pop_front();
    if (!outbox.empty()) {
      doWrite();
    } else if (closeRequested) {
      doClose();
    }
  }

  void doClose() {
    auto self = this->shared_from_this();
    beast::get_lowest_layer(ws).expires_after(CLOSE_LINGER);
    ws.async_close(websocket::close_code::normal,
                   [self](beast::error_code ec) {
                     if (ec) {
                       VLOG(1) << "Close handshake: " << ec.message();
                     }
                   });
  }

  void doAbort() {
    if (finished) {
      return;
    }
    resolver.cancel();
    beast::get_lowest_layer(ws).close();
  }

  void fail(const string& cause) {
    if (finished) {
      return;
    }
    finished = true;
    owner->onLinkFailed(this, cause);
  }

  WebSocketTransportSession* owner;
  Stream ws;
  tcp::resolver resolver;
  beast::flat_buffer buffer;
  string host;
  int port;
  string target;
  chrono::milliseconds connectTimeout;
  deque<shared_ptr<string>> outbox;
  bool opened;
  bool writing;
  bool closeRequested;
  bool finished;
};

WebSocketTransportSession::WebSocketTransportSession(
    chrono::milliseconds _connectTimeout)
    : workGuard(net::make_work_guard(ioc)),
      sslContext(net::ssl::context::tls_client),
      connectTimeout(_connectTimeout),
      connecting(false),
      open(false) {
  beast::error_code ec;
  sslContext.set_default_verify_paths(ec);
  if (ec) {
    LOG(WARNING) << "Cannot load system CA certificates: " << ec.message();
  }
  sslContext.set_verify_mode(net::ssl::verify_peer);
  ioThread.reset(new thread([this]() {
    el::Helpers::setThreadName("transport-io");
    while (true) {
      try {
        ioc.run();
        break;
      } catch (const std::exception& e) {
        STERROR << "Exception in transport io thread: " << e.what();
      }
    }
  }));
}

WebSocketTransportSession::~WebSocketTransportSession() {
  disconnect();
  auto lingerTimer = make_shared<net::steady_timer>(ioc, CLOSE_LINGER);
  lingerTimer->async_wait(
      [this, lingerTimer](beast::error_code) { ioc.stop(); });
  workGuard.reset();
  ioThread->join();
}

shared_ptr<WebSocketLink> WebSocketTransportSession::createLink(
    const ConnectionDescriptor& descriptor) {
  if (descriptor.isSecure()) {
    return make_shared<BasicWebSocketLink<SecureStream>>(
        this, descriptor, connectTimeout, net::make_strand(ioc), sslContext);
  }
  return make_shared<BasicWebSocketLink<PlainStream>>(
      this, descriptor, connectTimeout, net::make_strand(ioc));
}

bool WebSocketTransportSession::connect(
    const ConnectionDescriptor& descriptor) {
  shared_ptr<WebSocketLink> attempt;
  future<bool> opened;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    if (connecting) {
      VLOG(1) << "Connect already in flight";
      return false;
    }
    if (open) {
      LOG(WARNING) << "Transport already open";
      return false;
    }
    connecting = true;
    openPromise.reset(new promise<bool>());
    opened = openPromise->get_future();
    attempt = createLink(descriptor);
    link = attempt;
  }
  LOG(INFO) << "Connecting to " << descriptor;
  attempt->start();

  if (opened.wait_for(connectTimeout) != future_status::ready) {
    bool timedOut = false;
    {
      lock_guard<recursive_mutex> guard(classMutex);
      if (link == attempt && !open) {
        link.reset();
        resolveOpen(false);
        timedOut = true;
      }
    }
    if (timedOut) {
      attempt->abort();
      LOG(WARNING) << "Connect to " << descriptor << " timed out";
      net::post(ioc, [this]() { notifyError("Connection timed out"); });
    }
  }
  bool result = opened.get();
  lock_guard<recursive_mutex> guard(classMutex);
  connecting = false;
  return result;
}

bool WebSocketTransportSession::send(const Message& message) {
  lock_guard<recursive_mutex> guard(classMutex);
  if (!open || !link) {
    return false;
  }
  link->send(make_shared<string>(MessageCodec::encode(message)));
  return true;
}

void WebSocketTransportSession::disconnect() {
  shared_ptr<WebSocketLink> old;
  bool wasOpen;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    old = link;
    link.reset();
    wasOpen = open;
    open = false;
    resolveOpen(false);
  }
  if (old) {
    old->close();
  }
  if (wasOpen) {
    net::post(ioc, [this]() {
      notifyClose(websocket::close_code::normal, "Client disconnect");
    });
  }
}

bool WebSocketTransportSession::isOpen() {
  lock_guard<recursive_mutex> guard(classMutex);
  return open;
}

void WebSocketTransportSession::resolveOpen(bool opened) {
  if (openPromise) {
    openPromise->set_value(opened);
    openPromise.reset();
  }
}

void WebSocketTransportSession::onLinkOpen(WebSocketLink* source) {
  {
    lock_guard<recursive_mutex> guard(classMutex);
    if (source != link.get()) {
      source->close();
      return;
    }
    open = true;
    resolveOpen(true);
  }
  LOG(INFO) << "Transport open";
  notifyOpen();
}

void WebSocketTransportSession::onLinkFrame(WebSocketLink* source,
                                            const string& frame) {
  {
    lock_guard<recursive_mutex> guard(classMutex);
    if (source != link.get()) {
      return;
    }
  }
  DecodeResult decoded = MessageCodec::decode(frame);
  if (decoded.ok()) {
    notifyMessage(*decoded.message);
  } else if (decoded.status == DecodeStatus::UNKNOWN_TYPE) {
    VLOG(1) << "Ignoring message of unknown type '" << decoded.typeName
            << "'";
  } else {
    LOG(WARNING) << "Undecodable frame (" << decodeStatusName(decoded.status)
                 << "): " << decoded.reason;
    notifyDecodeFailure(frame, decoded.reason);
  }
}

void WebSocketTransportSession::onLinkFailed(WebSocketLink* source,
                                             const string& cause) {
  bool wasOpen;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    if (source != link.get()) {
      return;
    }
    link.reset();
    wasOpen = open;
    open = false;
    resolveOpen(false);
  }
  LOG(WARNING) << "Transport error: " << cause;
  notifyError(cause);
  if (wasOpen) {
    notifyClose(websocket::close_code::abnormal, cause);
  }
}

void WebSocketTransportSession::onLinkClosed(WebSocketLink* source, int code,
                                             const string& reason) {
  bool wasOpen;
  {
    lock_guard<recursive_mutex> guard(classMutex);
    if (source != link.get()) {
      return;
    }
    link.reset();
    wasOpen = open;
    open = false;
    resolveOpen(false);
  }
  LOG(INFO) << "Transport closed by peer (" << code << " " << reason << ")";
  if (wasOpen) {
    notifyClose(code, reason);
  }
}
}  // namespace tether
