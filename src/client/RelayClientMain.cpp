#include <sys/utsname.h>

#include <cxxopts.hpp>

#include "ClientSession.hpp"
#include "HostStore.hpp"
#include "LogHandler.hpp"
#include "PairingUri.hpp"
#include "TimeUtils.hpp"
#include "WebSocketTransportSession.hpp"

using namespace tether;

namespace {
// Extra time granted to the relay beyond the command's own deadline.
const int RESPONSE_SLACK_SECONDS = 30;

class ConsolePrinter : public ClientSessionListener {
 public:
  ConsolePrinter() : lastSuccess(false) {}

  void onTerminalLine(const TerminalLine& line) override {
    string text = line.text;
    if (!text.empty() && text.back() == '\n') {
      text.pop_back();
    }
    switch (line.kind) {
      case TerminalLineKind::COMMAND:
        break;
      case TerminalLineKind::OUTPUT:
        CLOG(INFO, "stdout") << text;
        break;
      case TerminalLineKind::ERROR:
        CLOG(INFO, "stdout") << "error: " << text;
        break;
      case TerminalLineKind::SYSTEM:
        CLOG(INFO, "stdout") << "* " << text;
        break;
    }
  }

  void onCommandFinished(const string& requestId, bool success) override {
    lastSuccess = success;
  }

  atomic<bool> lastSuccess;
};

ClientInfo localClientInfo() {
  ClientInfo info;
  struct utsname name;
  info.platform = ::uname(&name) == 0 ? toLower(name.sysname) : "unknown";
  info.version = TETHER_VERSION;
  return info;
}

void printHosts(HostStore& store) {
  auto hosts = store.list();
  if (hosts.empty()) {
    CLOG(INFO, "stdout") << "No saved hosts";
    return;
  }
  for (const auto& host : hosts) {
    string lastUsed = host.last_connected_ms()
                          ? formatTimestamp(host.last_connected_ms())
                          : string("never");
    CLOG(INFO, "stdout") << host.name() << "\t"
                         << HostStore::toDescriptor(host) << "\t"
                         << "last used " << lastUsed << "\t(" << host.id()
                         << ")";
  }
}

// Blocks until the outstanding command ends or the socket goes away.
bool waitForCommand(ClientSession& session, int timeoutSeconds) {
  auto deadline = chrono::steady_clock::now() +
                  chrono::seconds(timeoutSeconds + RESPONSE_SLACK_SECONDS);
  while (!session.waitForIdle(chrono::milliseconds(200))) {
    if (session.currentState() != ClientState::CONNECTED) {
      return false;
    }
    if (chrono::steady_clock::now() > deadline) {
      CLOG(INFO, "stdout") << "error: no response from relay";
      return false;
    }
  }
  return true;
}

void printStatus(ClientSession& session) {
  CLOG(INFO, "stdout") << "state: " << clientStateName(session.currentState());
  auto host = session.lastHost();
  if (host) {
    CLOG(INFO, "stdout") << "host: " << *host;
  }
  auto info = session.session();
  if (info) {
    string capabilities;
    for (const auto& it : info->capabilities) {
      capabilities += (capabilities.empty() ? "" : ", ") + it;
    }
    CLOG(INFO, "stdout") << "session: " << info->sessionId
                         << "\nserver version: " << info->serverVersion
                         << "\ncapabilities: " << capabilities;
  }
  string lastError = session.getLastError();
  if (!lastError.empty()) {
    CLOG(INFO, "stdout") << "last error: " << lastError;
  }
}

void runInteractive(ClientSession& session, const CommandOptions& options,
                    int timeoutSeconds) {
  string line;
  while (true) {
    cout << "tether> " << flush;
    if (!getline(cin, line)) {
      cout << endl;
      break;
    }
    string command = trim(line);
    if (command.empty()) {
      continue;
    }
    if (command == ":quit" || command == ":exit") {
      break;
    }
    if (command == ":ping") {
      CLOG(INFO, "stdout") << (session.ping() ? "* ping sent"
                                              : "error: not connected");
      continue;
    }
    if (command == ":status") {
      printStatus(session);
      continue;
    }
    if (command == ":reconnect") {
      if (session.currentState() == ClientState::CONNECTED) {
        session.disconnect();
      }
      session.resume();
      continue;
    }

    SubmitResult result = session.submitCommand(command, options);
    switch (result) {
      case SubmitResult::ACCEPTED:
        waitForCommand(session, timeoutSeconds);
        break;
      case SubmitResult::NOT_CONNECTED:
        CLOG(INFO, "stdout")
            << "error: not connected (use :reconnect to try again)";
        break;
      case SubmitResult::BUSY:
        CLOG(INFO, "stdout") << "error: a command is already running";
        break;
      case SubmitResult::INVALID:
        CLOG(INFO, "stdout") << "error: could not parse command";
        break;
      case SubmitResult::SEND_FAILED:
        break;
    }
  }
}
}  // namespace

int main(int argc, char** argv) {
  string tmpDir = GetTempDirectory();

  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tether::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, tether::InterruptSignalHandler);
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("tether", "Send commands to a paired relay host");
  int exitCode = 0;
  try {
    options.positional_help("");
    options.custom_help(
        "[OPTION...] [ws://host:port/ws?key=TOKEN]\n\n"
        "  Pass the pairing URI printed by tetherserver, or --host NAME for a "
        "saved host.");

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("uri", "Pairing URI", cxxopts::value<std::string>())  //
        ("host", "Connect to a saved host (name or id)",
         cxxopts::value<std::string>())  //
        ("save", "Save the pairing URI under this name",
         cxxopts::value<std::string>())  //
        ("list", "List saved hosts")     //
        ("forget", "Remove a saved host",
         cxxopts::value<std::string>())  //
        ("hosts-file", "Location of the saved host store",
         cxxopts::value<std::string>())  //
        ("c,command", "Run one command, print its output and exit",
         cxxopts::value<std::string>())  //
        ("timeout", "Command timeout in seconds",
         cxxopts::value<int>())  //
        ("mode", "Assistant mode (batch or continue)",
         cxxopts::value<std::string>()->default_value(""))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"))  //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>()->default_value(tmpDir))  //
        ("logtostdout", "Write log to stdout")                  //
        ("silent", "Disable logging")                           //
        ;

    options.parse_positional({"uri"});
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "tether version " << TETHER_VERSION << endl;
      exit(0);
    }

    LogOptions logOptions;
    logOptions.directory = result["logdir"].as<string>();
    logOptions.filenamePrefix = "tether";
    logOptions.verbosity = result["verbose"].as<int>();
    logOptions.logToStdout = result.count("logtostdout") > 0;
    logOptions.redirectStderrToFile = !logOptions.logToStdout;
    logOptions.silent = result.count("silent") > 0;
    LogHandler::applyLogOptions(&defaultConf, logOptions);
    el::Helpers::setThreadName("client-main");

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    HostStore store(result.count("hosts-file")
                        ? result["hosts-file"].as<string>()
                        : HostStore::defaultPath());
    store.load();

    if (result.count("list")) {
      printHosts(store);
      exit(0);
    }
    if (result.count("forget")) {
      string name = result["forget"].as<string>();
      if (!store.remove(name)) {
        CLOG(INFO, "stdout") << "No saved host named " << name;
        exit(1);
      }
      CLOG(INFO, "stdout") << "Forgot " << name;
      exit(0);
    }

    ConnectionDescriptor descriptor;
    optional<string> hostId;
    if (result.count("uri")) {
      PairingResult pairing = PairingUri::decode(result["uri"].as<string>());
      if (!pairing.ok()) {
        CLOG(INFO, "stdout") << "Invalid pairing URI ("
                             << pairingErrorName(pairing.error)
                             << "): " << pairing.detail;
        exit(1);
      }
      descriptor = *pairing.descriptor;
      if (result.count("save")) {
        KnownHost saved = store.save(result["save"].as<string>(), descriptor);
        CLOG(INFO, "stdout") << "Saved " << saved.name() << " (" << saved.id()
                             << ")";
        hostId = saved.id();
      }
    } else if (result.count("host")) {
      string name = result["host"].as<string>();
      auto known = store.get(name);
      if (!known) {
        CLOG(INFO, "stdout") << "No saved host named " << name
                             << " (see --list)";
        exit(1);
      }
      descriptor = HostStore::toDescriptor(*known);
      hostId = known->id();
    } else {
      CLOG(INFO, "stdout") << "Missing pairing URI or --host" << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(1);
    }

    CommandOptions commandOptions;
    commandOptions.mode = result["mode"].as<string>();
    int timeoutSeconds = 300;
    if (result.count("timeout")) {
      timeoutSeconds = result["timeout"].as<int>();
      commandOptions.timeoutSeconds = timeoutSeconds;
    }

    shared_ptr<TransportSession> transport(new WebSocketTransportSession());
    ClientSession session(transport, localClientInfo());
    shared_ptr<ConsolePrinter> printer(new ConsolePrinter());
    session.addListener(printer);

    if (!session.connect(descriptor)) {
      LOG(ERROR) << "Could not connect: " << session.getLastError();
      exit(1);
    }
    if (hostId) {
      auto info = session.session();
      store.touch(*hostId, info ? info->capabilities : vector<string>());
    }

    if (result.count("command")) {
      SubmitResult submitted =
          session.submitCommand(result["command"].as<string>(), commandOptions);
      if (submitted != SubmitResult::ACCEPTED) {
        CLOG(INFO, "stdout") << "error: " << submitResultName(submitted);
        exitCode = 1;
      } else if (!waitForCommand(session, timeoutSeconds) ||
                 !printer->lastSuccess) {
        exitCode = 1;
      }
    } else {
      runInteractive(session, commandOptions, timeoutSeconds);
    }
    session.disconnect();
  } catch (cxxopts::exceptions::exception& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error& re) {
    CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return exitCode;
}
