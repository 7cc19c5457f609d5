#include "ClientSession.hpp"
#include "MessageCodec.hpp"
#include "RelayServer.hpp"
#include "SubprocessUtils.hpp"
#include "TestHeaders.hpp"
#include "WebSocketTransportSession.hpp"

namespace tether {
namespace {
const string TOKEN = "integration-token";

void runOrThrow(const vector<string>& argv, const string& directory) {
  auto result = SubprocessToString(argv, directory);
  if (result.exitCode != 0) {
    throw std::runtime_error(argv[0] + " " + argv[1] +
                             " failed: " + result.output);
  }
}

/**
 * @brief Blocking HTTP GET against the relay.
 */
pair<int, json> httpGet(int port, const string& target) {
  net::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::tcp_stream stream(ioc);
  stream.connect(resolver.resolve("127.0.0.1", to_string(port)));

  http::request<http::string_body> request(http::verb::get, target, 11);
  request.set(http::field::host, "127.0.0.1");
  http::write(stream, request);

  beast::flat_buffer buffer;
  http::response<http::string_body> response;
  http::read(stream, buffer, response);
  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
  return make_pair(int(response.result_int()),
                   json::parse(response.body(), nullptr, false));
}

/**
 * @brief Synchronous WebSocket client for frames the regular client never
 * sends.
 */
class RawRelayClient {
 public:
  explicit RawRelayClient(int port) : ws(ioc) {
    tcp::resolver resolver(ioc);
    net::connect(ws.next_layer(),
                 resolver.resolve("127.0.0.1", to_string(port)));
    ws.handshake("127.0.0.1:" + to_string(port), "/ws");
  }

  void sendFrame(const string& frame) { ws.write(net::buffer(frame)); }

  void send(const Message& message) {
    sendFrame(MessageCodec::encode(message));
  }

  Message receive() {
    beast::flat_buffer buffer;
    ws.read(buffer);
    auto decoded =
        MessageCodec::decode(beast::buffers_to_string(buffer.data()));
    if (!decoded.ok()) {
      throw std::runtime_error("Relay sent a bad frame: " + decoded.reason);
    }
    return *decoded.message;
  }

  Message authenticate() {
    AuthPayload auth;
    auth.token = TOKEN;
    auth.clientInfo.platform = "raw";
    auth.clientInfo.version = "0";
    send(Message::create(auth));
    return receive();
  }

  void close() { ws.close(websocket::close_code::normal); }

  net::io_context ioc;
  websocket::stream<tcp::socket> ws;
};

Message executeRequest(const string& command, const string& requestId) {
  AssistantExecutePayload payload;
  payload.command = command;
  auto message = Message::create(payload);
  message.requestId = requestId;
  return message;
}

struct RelayFixture {
  RelayFixture() : workdir(makeTempDirectory("tether_relay")) {
    runOrThrow({"git", "init", "-q"}, workdir);
    runOrThrow({"git", "config", "user.name", "Tether Test"}, workdir);
    runOrThrow({"git", "config", "user.email", "tether@example.com"},
               workdir);
    runOrThrow({"git", "config", "commit.gpgsign", "false"}, workdir);
    ofstream(workdir + "/README") << "relay\n";
    runOrThrow({"git", "add", "README"}, workdir);
    runOrThrow({"git", "commit", "-q", "-m", "Initial commit"}, workdir);

    RelayServerConfig config;
    config.bindIp = "127.0.0.1";
    config.port = 0;
    config.token = TOKEN;
    config.authDeadlineSeconds = 2;
    config.execution.workingDirectory = workdir;
    config.execution.shellPrefixes = {"echo", "sleep"};
    config.execution.killGraceMillis = 200;
    server.reset(new RelayServer(config));
    server->start();
  }

  ~RelayFixture() {
    server->shutdown();
    fs::remove_all(workdir);
  }

  ConnectionDescriptor descriptor(const string& token = TOKEN) {
    return ConnectionDescriptor("127.0.0.1", server->getPort(), token);
  }

  shared_ptr<ClientSession> makeClient() {
    ClientInfo info;
    info.platform = "integration";
    info.version = TETHER_VERSION;
    return make_shared<ClientSession>(
        make_shared<WebSocketTransportSession>(chrono::seconds(5)), info,
        chrono::seconds(5));
  }

  string workdir;
  unique_ptr<RelayServer> server;
};

TerminalLine lastLine(const shared_ptr<ClientSession>& client) {
  auto lines = client->getTerminalLog().getLines();
  if (lines.empty()) {
    throw std::runtime_error("No terminal lines");
  }
  return lines.back();
}
}  // namespace

TEST_CASE("A paired client runs a command end to end", "[RelayServer]") {
  RelayFixture fixture;
  REQUIRE(fixture.server->getPort() > 0);
  auto client = fixture.makeClient();

  REQUIRE(client->connect(fixture.descriptor()));
  REQUIRE(client->currentState() == ClientState::CONNECTED);
  auto info = client->session();
  REQUIRE(info);
  REQUIRE(info->sessionId.size() == 36);
  REQUIRE(info->serverVersion == TETHER_VERSION);
  REQUIRE(info->protocolVersion == PROTOCOL_VERSION);
  REQUIRE(waitUntil(
      [&]() {
        return fixture.server->getRegistry()->countAuthenticated() == 1;
      },
      chrono::seconds(5)));

  REQUIRE(client->submitCommand("echo hi") == SubmitResult::ACCEPTED);
  REQUIRE(client->waitForIdle(chrono::seconds(10)));
  auto line = lastLine(client);
  REQUIRE(line.kind == TerminalLineKind::OUTPUT);
  REQUIRE(line.text == "hi\n");

  REQUIRE(client->ping());
  client->disconnect();
  REQUIRE(client->currentState() == ClientState::DISCONNECTED);
  REQUIRE(waitUntil(
      [&]() { return fixture.server->getRegistry()->listSessions().empty(); },
      chrono::seconds(5)));
}

TEST_CASE("A wrong token leaves the client in Error", "[RelayServer]") {
  RelayFixture fixture;
  auto client = fixture.makeClient();
  REQUIRE_FALSE(client->connect(fixture.descriptor("not-the-token")));
  REQUIRE(client->currentState() == ClientState::ERROR);
  REQUIRE(client->getLastError() ==
          "Authentication failed: Invalid session token");
  REQUIRE(waitUntil(
      [&]() { return fixture.server->getRegistry()->listSessions().empty(); },
      chrono::seconds(5)));

  REQUIRE(client->connect(fixture.descriptor()));
  REQUIRE(client->currentState() == ClientState::CONNECTED);
}

TEST_CASE("Nothing listening means Disconnected", "[RelayServer]") {
  int port;
  {
    net::io_context ioc;
    tcp::acceptor closedPort(
        ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    port = closedPort.local_endpoint().port();
  }
  RelayFixture fixture;
  auto client = fixture.makeClient();
  REQUIRE_FALSE(
      client->connect(ConnectionDescriptor("127.0.0.1", port, TOKEN)));
  REQUIRE(client->currentState() == ClientState::DISCONNECTED);
  REQUIRE_THAT(client->getLastError(),
               Catch::Matchers::StartsWith("Cannot reach"));
}

TEST_CASE("Unknown message types are ignored", "[RelayServer]") {
  RelayFixture fixture;
  RawRelayClient raw(fixture.server->getPort());
  auto authResult = raw.authenticate();
  REQUIRE(authResult.status == ResponseStatus::SUCCESS);

  raw.sendFrame(R"({"type":"subscribe","data":{"topic":"all"}})");
  PingPayload ping;
  ping.timestamp = 77;
  raw.send(Message::create(ping));
  auto pong = raw.receive();
  REQUIRE(pong.getType() == MessageType::PONG);
  REQUIRE(pong.get<PongPayload>()->timestamp == 77);
  REQUIRE(pong.sessionId == authResult.sessionId);
  raw.close();
}

TEST_CASE("The key query parameter authenticates the upgrade",
          "[RelayServer]") {
  RelayFixture fixture;
  net::io_context ioc;
  websocket::stream<tcp::socket> ws(ioc);
  tcp::resolver resolver(ioc);
  net::connect(ws.next_layer(),
               resolver.resolve("127.0.0.1",
                                to_string(fixture.server->getPort())));
  ws.handshake("127.0.0.1", "/api/ws?key=" + TOKEN);

  AuthPayload auth;
  string frame = MessageCodec::encode(Message::create(auth));
  ws.write(net::buffer(frame));
  beast::flat_buffer buffer;
  ws.read(buffer);
  auto decoded =
      MessageCodec::decode(beast::buffers_to_string(buffer.data()));
  REQUIRE(decoded.ok());
  REQUIRE(decoded.message->status == ResponseStatus::SUCCESS);
  ws.close(websocket::close_code::normal);
}

TEST_CASE("Sockets that never authenticate are closed", "[RelayServer]") {
  RelayFixture fixture;
  RawRelayClient raw(fixture.server->getPort());
  auto error = raw.receive();
  REQUIRE(error.getType() == MessageType::ERROR);
  REQUIRE(error.get<ErrorPayload>()->message == "Authentication timed out");

  beast::flat_buffer buffer;
  beast::error_code ec;
  raw.ws.read(buffer, ec);
  REQUIRE(ec == websocket::error::closed);
  REQUIRE(raw.ws.reason().code == websocket::close_code::policy_error);
}

TEST_CASE("Slow commands time out", "[RelayServer]") {
  RelayFixture fixture;
  auto client = fixture.makeClient();
  REQUIRE(client->connect(fixture.descriptor()));

  CommandOptions options;
  options.timeoutSeconds = 1;
  auto start = chrono::steady_clock::now();
  REQUIRE(client->submitCommand("sleep 5", options) == SubmitResult::ACCEPTED);
  REQUIRE(client->waitForIdle(chrono::seconds(10)));
  REQUIRE(chrono::steady_clock::now() - start < chrono::seconds(4));
  auto line = lastLine(client);
  REQUIRE(line.kind == TerminalLineKind::ERROR);
  REQUIRE(line.text == "Command timed out after 1 seconds");
  REQUIRE(client->currentState() == ClientState::CONNECTED);
}

TEST_CASE("One command per session, killed when the socket closes",
          "[RelayServer]") {
  RelayFixture fixture;
  RawRelayClient raw(fixture.server->getPort());
  REQUIRE(raw.authenticate().status == ResponseStatus::SUCCESS);

  raw.send(executeRequest("sleep 5", "slow"));
  raw.send(executeRequest("echo hi", "fast"));
  auto busy = raw.receive();
  REQUIRE(busy.getType() == MessageType::ERROR);
  REQUIRE(busy.requestId == optional<string>("fast"));
  REQUIRE(busy.get<ErrorPayload>()->message == "A command is already running");

  auto registry = fixture.server->getRegistry();
  auto sessions = registry->listSessions();
  REQUIRE(sessions.size() == 1);
  REQUIRE(sessions[0].executing);
  auto execution = registry->getExecution(sessions[0].connectionId);
  REQUIRE(execution);
  REQUIRE(waitUntil([&]() { return execution->getPid() > 0; },
                    chrono::seconds(5)));
  pid_t pid = execution->getPid();

  auto [status, body] =
      httpGet(fixture.server->getPort(), "/status?key=" + TOKEN);
  REQUIRE(status == 200);
  REQUIRE(body["sessions"][0]["health"] == "executing");
  REQUIRE(body["sessions"][0]["request_id"] == "slow");

  raw.close();
  REQUIRE(execution->waitFor(chrono::seconds(5)));
  REQUIRE(execution->getStatus() == ExecutionStatus::CANCELLED);
  REQUIRE(waitUntil([&]() { return !processExists(pid); },
                    chrono::seconds(5)));
}

TEST_CASE("Git operations run in the relay working directory",
          "[RelayServer]") {
  RelayFixture fixture;
  auto client = fixture.makeClient();
  REQUIRE(client->connect(fixture.descriptor()));

  REQUIRE(client->submitCommand("git commit -m 'nothing new'") ==
          SubmitResult::ACCEPTED);
  REQUIRE(client->waitForIdle(chrono::seconds(30)));
  auto line = lastLine(client);
  REQUIRE(line.kind == TerminalLineKind::OUTPUT);
  REQUIRE(line.text == "No changes to commit");

  REQUIRE(client->submitCommand("git log -n 1") == SubmitResult::ACCEPTED);
  REQUIRE(client->waitForIdle(chrono::seconds(30)));
  REQUIRE_THAT(lastLine(client).text,
               Catch::Matchers::ContainsSubstring("Initial commit"));

  REQUIRE(client->submitCommand("git push") == SubmitResult::ACCEPTED);
  REQUIRE(client->waitForIdle(chrono::seconds(30)));
  REQUIRE(lastLine(client).kind == TerminalLineKind::ERROR);
  REQUIRE(lastLine(client).text == "Unsupported git operation: push");
}

TEST_CASE("Health and status endpoints", "[RelayServer]") {
  RelayFixture fixture;
  int port = fixture.server->getPort();

  auto [healthStatus, health] = httpGet(port, "/health");
  REQUIRE(healthStatus == 200);
  REQUIRE(health["status"] == "ok");
  REQUIRE(health["version"] == TETHER_VERSION);
  REQUIRE(health["protocol_version"] == PROTOCOL_VERSION);
  REQUIRE_FALSE(health.contains("sessions"));

  auto [deniedStatus, denied] = httpGet(port, "/status?key=wrong");
  REQUIRE(deniedStatus == 401);
  REQUIRE(denied["error"] == "invalid key");

  auto client = fixture.makeClient();
  REQUIRE(client->connect(fixture.descriptor()));
  auto [statusCode, status] = httpGet(port, "/status?key=" + TOKEN);
  REQUIRE(statusCode == 200);
  REQUIRE(status["session_count"] == 1);
  REQUIRE(status["pending_connections"] == 0);
  REQUIRE(status["sessions"].size() == 1);
  REQUIRE(status["sessions"][0]["health"] == "idle");
  REQUIRE(status["sessions"][0]["platform"] == "integration");
  REQUIRE(status["sessions"][0]["session_id"] == client->session()->sessionId);

  auto [missingStatus, missing] = httpGet(port, "/nope");
  REQUIRE(missingStatus == 404);
}
}  // namespace tether
