#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "NetworkUtils.hpp"
#include "PairingUri.hpp"
#include "RelayServer.hpp"
#include "ServerConfig.hpp"

using namespace tether;

namespace {
const int PAIRING_TOKEN_LENGTH = 32;

void printBanner(const RelayServerConfig& config, const string& publicHost,
                 int port) {
  ConnectionDescriptor descriptor(publicHost, port, config.token, Scheme::WS);
  string workdir = config.execution.workingDirectory.empty()
                       ? fs::current_path().string()
                       : config.execution.workingDirectory;
  CLOG(INFO, "stdout") << endl
                       << "tetherserver " << TETHER_VERSION << endl
                       << "  listening on " << config.bindIp << ":" << port
                       << endl
                       << "  working directory " << workdir << endl;
  if (config.authMode == AuthMode::TOKEN) {
    CLOG(INFO, "stdout") << "  pairing URI: " << PairingUri::encode(descriptor)
                         << endl
                         << endl;
  } else {
    CLOG(INFO, "stdout")
        << "  WARNING: authentication is disabled (auth mode 'open')" << endl
        << "  connect to ws://" << publicHost << ":" << port << RELAY_WS_PATH
        << endl
        << endl;
  }
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tether::HandleTerminate();

  cxxopts::Options options("tetherserver",
                           "Relays commands from a paired phone to this host");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("port", "Port to listen on",
         cxxopts::value<int>()->default_value(to_string(DEFAULT_RELAY_PORT)))  //
        ("bindip", "IP to listen on",
         cxxopts::value<string>()->default_value("0.0.0.0"))  //
        ("public-host", "Host written into the pairing URI",
         cxxopts::value<string>()->default_value(""))  //
        ("token", "Use this pairing token instead of a random one",
         cxxopts::value<string>()->default_value(""))  //
        ("auth-mode", "token or open",
         cxxopts::value<string>()->default_value("token"))  //
        ("workdir", "Directory commands run in",
         cxxopts::value<string>()->default_value(""))  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("logdir", "Base directory for log files.",
         cxxopts::value<std::string>())  //
        ("silent", "Disable logging")    //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "tetherserver version " << TETHER_VERSION
                           << endl;
      exit(0);
    }

    RelayServerConfig config;
    DebugConfig debugConfig;

    const char* envPort = ::getenv("TETHER_PORT");
    if (envPort != NULL && envPort[0] != '\0') {
      try {
        config.port = stoi(envPort);
      } catch (const std::logic_error&) {
        CLOG(INFO, "stdout") << "Ignoring invalid TETHER_PORT: " << envPort
                             << endl;
      }
    }

    if (result.count("cfgfile") &&
        !result["cfgfile"].as<string>().empty()) {
      loadServerConfigFile(result["cfgfile"].as<string>(), &config,
                           &debugConfig);
    }

    if (result.count("port")) {
      config.port = result["port"].as<int>();
    }
    if (result.count("bindip")) {
      config.bindIp = result["bindip"].as<string>();
    }
    if (result.count("public-host")) {
      config.publicHost = result["public-host"].as<string>();
    }
    if (result.count("token")) {
      config.token = result["token"].as<string>();
    }
    if (result.count("auth-mode")) {
      config.authMode = parseAuthMode(result["auth-mode"].as<string>());
    }
    if (result.count("workdir")) {
      config.execution.workingDirectory = result["workdir"].as<string>();
    }

    LogOptions logOptions;
    logOptions.directory = result.count("logdir")
                               ? result["logdir"].as<string>()
                               : GetTempDirectory();
    logOptions.filenamePrefix = "tetherserver";
    logOptions.logToStdout = result.count("logtostdout") > 0;
    logOptions.redirectStderrToFile = !logOptions.logToStdout;
    logOptions.verbosity = result.count("verbose")
                               ? result["verbose"].as<int>()
                               : debugConfig.verbose.value_or(0);
    logOptions.silent = result.count("silent") > 0 || debugConfig.silent;
    logOptions.maxLogSize = debugConfig.maxLogSize;
    LogHandler::applyLogOptions(&defaultConf, logOptions);
    el::Helpers::setThreadName("tetherserver-main");

    if (sodium_init() == -1) {
      STFATAL << "libsodium init failed";
    }
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    if (config.token.empty()) {
      config.token = genRandomAlphaNum(PAIRING_TOKEN_LENGTH);
    }
    validateServerConfig(config);

    string publicHost = config.publicHost;
    if (publicHost.empty()) {
      publicHost = detectLanAddress();
    }

    // Block the termination signals before any thread starts so that only
    // sigwait below sees them.
    ::signal(SIGPIPE, SIG_IGN);
    sigset_t waitSet;
    sigemptyset(&waitSet);
    sigaddset(&waitSet, SIGINT);
    sigaddset(&waitSet, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &waitSet, NULL) != 0) {
      STFATAL << "Cannot block termination signals";
    }

    RelayServer server(config);
    server.start();
    printBanner(config, publicHost, server.getPort());

    int signum = 0;
    if (sigwait(&waitSet, &signum) != 0) {
      STFATAL << "sigwait failed";
    }
    LOG(INFO) << "Got signal " << signum << ", shutting down";
    CLOG(INFO, "stdout") << endl << "Shutting down..." << endl;
    server.shutdown();
  } catch (cxxopts::exceptions::exception& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error& re) {
    CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
    LOG(ERROR) << "Fatal startup error: " << re.what();
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
