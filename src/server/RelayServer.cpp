#include "RelayServer.hpp"

#include "PairingUri.hpp"
#include "TimeUtils.hpp"

namespace tether {
namespace {
const chrono::seconds HTTP_READ_TIMEOUT(10);
const chrono::milliseconds SHUTDOWN_LINGER(1000);

string queryParameter(const string& query, const string& name) {
  for (const auto& pair : split(query, '&')) {
    auto equals = pair.find('=');
    if (pair.substr(0, equals) != name) {
      continue;
    }
    auto decoded = PairingUri::percentDecode(
        equals == string::npos ? string() : pair.substr(equals + 1));
    return decoded ? *decoded : string();
  }
  return "";
}

string sessionHealth(const SessionSnapshot& session) {
  if (!session.authenticated) {
    return "authenticating";
  }
  return session.executing ? "executing" : "idle";
}
}  // namespace

/**
 * @brief Reads the first HTTP request on a fresh connection and dispatches
 * it.
 */
class HttpSession : public enable_shared_from_this<HttpSession> {
 public:
  HttpSession(tcp::socket&& socket, RelayServer* _server)
      : stream(std::move(socket)), server(_server) {}

  void run() {
    stream.expires_after(HTTP_READ_TIMEOUT);
    http::async_read(
        stream, buffer, request,
        beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
  }

 protected:
  void onRead(beast::error_code ec, size_t bytesTransferred) {
    if (ec) {
      VLOG(1) << "HTTP read failed: " << ec.message();
      return;
    }
    string target(request.target());
    auto queryStart = target.find('?');
    string path = target.substr(0, queryStart);
    string query =
        queryStart == string::npos ? string() : target.substr(queryStart + 1);

    if (websocket::is_upgrade(request)) {
      if (path != RELAY_WS_PATH && path != RELAY_WS_ALIAS_PATH) {
        respond(http::status::not_found, {{"error", "not found"}});
        return;
      }
      string token = queryParameter(query, "key");
      make_shared<RelaySession>(
          stream.release_socket(), server->handler,
          chrono::seconds(server->config.authDeadlineSeconds))
          ->run(std::move(request), token);
      return;
    }

    if (request.method() != http::verb::get) {
      respond(http::status::method_not_allowed,
              {{"error", "method not allowed"}});
    } else if (path == "/health") {
      respond(http::status::ok, server->buildStatus(false));
    } else if (path == "/status") {
      string key = queryParameter(query, "key");
      if (server->config.authMode == AuthMode::TOKEN &&
          !constantTimeEquals(key, server->config.token)) {
        LOG(WARNING) << "Rejected status request without a valid key";
        respond(http::status::unauthorized, {{"error", "invalid key"}});
      } else {
        respond(http::status::ok, server->buildStatus(true));
      }
    } else {
      respond(http::status::not_found, {{"error", "not found"}});
    }
  }

  void respond(http::status status, const json& body) {
    auto response = make_shared<http::response<http::string_body>>(
        status, request.version());
    response->set(http::field::server,
                  string("tetherserver/") + TETHER_VERSION);
    response->set(http::field::content_type, "application/json");
    response->keep_alive(false);
    response->body() = body.dump();
    response->prepare_payload();
    http::async_write(
        stream, *response,
        [self = shared_from_this(), response](beast::error_code ec, size_t) {
          if (ec) {
            VLOG(1) << "HTTP write failed: " << ec.message();
          }
          beast::error_code ignored;
          self->stream.socket().shutdown(tcp::socket::shutdown_send, ignored);
        });
  }

  beast::tcp_stream stream;
  beast::flat_buffer buffer;
  http::request<http::string_body> request;
  RelayServer* server;
};

RelayServer::RelayServer(const RelayServerConfig& _config)
    : config(_config),
      ioc(_config.ioThreads),
      workGuard(net::make_work_guard(ioc)),
      acceptor(ioc),
      registry(new SessionRegistry()),
      boundPort(-1),
      startedAtMs(currentTimeMillis()),
      running(false) {
  handler.reset(new RelayProtocolHandler(registry, config));
}

RelayServer::~RelayServer() { shutdown(); }

void RelayServer::start() {
  validateServerConfig(config);
  beast::error_code ec;
  auto address = net::ip::make_address(config.bindIp, ec);
  if (ec) {
    throw std::runtime_error("Invalid bind address '" + config.bindIp +
                             "': " + ec.message());
  }
  tcp::endpoint endpoint(address, (unsigned short)config.port);
  acceptor.open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor.set_option(net::socket_base::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor.bind(endpoint, ec);
  }
  if (!ec) {
    acceptor.listen(net::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    throw std::runtime_error("Cannot listen on " + config.bindIp + ":" +
                             to_string(config.port) + ": " + ec.message());
  }
  boundPort = acceptor.local_endpoint().port();
  startedAtMs = currentTimeMillis();
  running = true;
  LOG(INFO) << "Relay listening on " << config.bindIp << ":" << boundPort
            << " (auth mode " << authModeName(config.authMode) << ")";

  doAccept();
  for (int i = 0; i < config.ioThreads; i++) {
    ioThreads.push_back(make_shared<thread>([this, i]() {
      el::Helpers::setThreadName("relay-io-" + to_string(i));
      while (true) {
        try {
          ioc.run();
          break;
        } catch (const std::exception& e) {
          STERROR << "Exception in relay io thread: " << e.what();
        }
      }
    }));
  }
}

void RelayServer::shutdown() {
  if (!running.exchange(false)) {
    return;
  }
  LOG(INFO) << "Shutting down relay server";
  net::post(ioc, [this]() {
    beast::error_code ec;
    acceptor.close(ec);
  });
  registry->shutdown(
      chrono::milliseconds(config.execution.killGraceMillis) +
      chrono::seconds(1));

  // Give close handshakes a moment, then stop regardless.
  auto lingerTimer = make_shared<net::steady_timer>(ioc, SHUTDOWN_LINGER);
  lingerTimer->async_wait(
      [this, lingerTimer](beast::error_code) { ioc.stop(); });
  workGuard.reset();
  for (auto& it : ioThreads) {
    it->join();
  }
  ioThreads.clear();
}

void RelayServer::doAccept() {
  acceptor.async_accept(
      net::make_strand(ioc),
      beast::bind_front_handler(&RelayServer::onAccept, this));
}

void RelayServer::onAccept(beast::error_code ec, tcp::socket socket) {
  if (ec == net::error::operation_aborted || !acceptor.is_open()) {
    return;
  }
  if (ec) {
    LOG(WARNING) << "Accept failed: " << ec.message();
  } else {
    VLOG(1) << "Accepted connection";
    make_shared<HttpSession>(std::move(socket), this)->run();
  }
  doAccept();
}

json RelayServer::sessionsToJson(const vector<SessionSnapshot>& sessions) {
  json result = json::array();
  for (const auto& session : sessions) {
    json entry = {
        {"connection_id", session.connectionId},
        {"peer_address", session.peerAddress},
        {"health", sessionHealth(session)},
        {"connected_at", formatTimestamp(session.connectedAtMs)},
    };
    if (session.authenticated) {
      entry["session_id"] = session.sessionId;
      entry["platform"] = session.platform;
      entry["client_version"] = session.clientVersion;
      entry["authenticated_at"] = formatTimestamp(session.authenticatedAtMs);
    }
    if (session.executing) {
      entry["running_command"] = session.runningCommand;
      if (session.runningRequestId) {
        entry["request_id"] = *session.runningRequestId;
      }
    }
    result.push_back(entry);
  }
  return result;
}

json RelayServer::buildStatus(bool includeSessions) {
  json status = {
      {"status", "ok"},
      {"version", TETHER_VERSION},
      {"protocol_version", PROTOCOL_VERSION},
      {"uptime_seconds", (currentTimeMillis() - startedAtMs) / 1000},
  };
  if (includeSessions) {
    auto sessions = registry->listSessions();
    int authenticated = 0;
    for (const auto& session : sessions) {
      if (session.authenticated) authenticated++;
    }
    status["session_count"] = authenticated;
    status["pending_connections"] = int(sessions.size()) - authenticated;
    status["sessions"] = sessionsToJson(sessions);
  }
  return status;
}
}  // namespace tether
