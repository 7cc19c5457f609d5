#ifndef __TETHER_HEADERS__
#define __TETHER_HEADERS__

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netdb.h>
#include <netinet/in.h>
#include <paths.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <errno.h>
#include <fcntl.h>
#include <sodium.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

#include "Tether.pb.h"
#include "easylogging++.h"
#include "sago/platform_folders.h"
#include "sole.hpp"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

// Wire protocol revision reported in auth_result.
static const int PROTOCOL_VERSION = 1;

// Default relay port, matches the port printed in pairing URIs.
const int DEFAULT_RELAY_PORT = 8090;

// WebSocket path on the relay server. The second path is accepted as an alias.
const string RELAY_WS_PATH = "/ws";
const string RELAY_WS_ALIAS_PATH = "/api/ws";

// Client connect (and auth handshake) timeout.
const int CLIENT_CONNECT_TIMEOUT_SECONDS = 15;
// Sockets that do not send auth within this window are closed.
const int SERVER_AUTH_DEADLINE_SECONDS = 10;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

inline int GetErrno() { return errno; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef TETHER_VERSION
#define TETHER_VERSION "unknown"
#endif

namespace tether {
template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

/**
 * @brief Splits on runs of blanks (space, tab, newline), dropping empties.
 */
inline std::vector<std::string> splitWhitespace(const std::string &s) {
  std::vector<std::string> elems;
  std::istringstream iss(s);
  std::string item;
  while (iss >> item) {
    elems.push_back(item);
  }
  return elems;
}

inline string trim(const string &s) {
  const char *ws = " \t\r\n";
  auto start = s.find_first_not_of(ws);
  if (start == string::npos) return "";
  auto end = s.find_last_not_of(ws);
  return s.substr(start, end - start + 1);
}

inline bool startsWith(const string &s, const string &prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline string toLower(string s) {
  transform(s.begin(), s.end(), s.begin(),
            [](unsigned char c) { return (char)tolower(c); });
  return s;
}

template <typename T>
inline string protoToString(const T &t) {
  string s;
  if (!t.SerializeToString(&s)) {
    STFATAL << "Error serializing proto to string";
  }
  return s;
}

inline string genRandomAlphaNum(int len) {
  static const char alphanum[] =
      "0123456789"
      "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
      "abcdefghijklmnopqrstuvwxyz";
  string s(len, '\0');

  for (int i = 0; i < len; ++i) {
    s[i] = alphanum[randombytes_uniform(sizeof(alphanum) - 1)];
  }

  return s;
}

/**
 * @brief Compares two secrets without leaking the mismatch position.
 */
inline bool constantTimeEquals(const string &a, const string &b) {
  if (a.length() != b.length()) {
    return false;
  }
  return sodium_memcmp(a.data(), b.data(), a.length()) == 0;
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline int64_t currentTimeMillis() {
  return chrono::duration_cast<chrono::milliseconds>(
             chrono::system_clock::now().time_since_epoch())
      .count();
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  STERROR << "Got interrupt";
  CLOG(INFO, "stdout") << endl
                       << "Got interrupt (perhaps ctrl+c?).  Exiting." << endl;
  ::exit(signum);
}
}  // namespace tether

#endif
