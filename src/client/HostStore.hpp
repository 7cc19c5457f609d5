#ifndef __TETHER_HOST_STORE__
#define __TETHER_HOST_STORE__

#include "ConnectionDescriptor.hpp"
#include "Headers.hpp"

namespace tether {
/**
 * @brief Relay hosts the user has paired with, persisted as a KnownHostList
 * protobuf. Names are unique; ids are `host:port-<millis>`.
 *
 * Every mutation is written through to disk. The file holds pairing tokens
 * and is created owner-only.
 */
class HostStore {
 public:
  explicit HostStore(const string& _path);

  /**
   * @brief `<config home>/tether/hosts.pb`.
   */
  static string defaultPath();

  /**
   * @brief Reads the file. A missing file is an empty store.
   * @throws std::runtime_error if the file exists but cannot be parsed.
   */
  void load();

  /**
   * @brief Most recently used first, never-used hosts by name.
   */
  vector<KnownHost> list();

  optional<KnownHost> get(const string& nameOrId);

  /**
   * @brief Stores `descriptor` under `name`, replacing the host of the same
   * name if there is one.
   */
  KnownHost save(const string& name, const ConnectionDescriptor& descriptor);

  /**
   * @brief Records a successful connection.
   * @return false if no such host.
   */
  bool touch(const string& id, const vector<string>& capabilities);

  bool rename(const string& id, const string& newName);

  bool remove(const string& nameOrId);

  static ConnectionDescriptor toDescriptor(const KnownHost& host);

 protected:
  int find(const string& nameOrId);
  void persist();

  string path;
  recursive_mutex classMutex;
  KnownHostList hosts;
};
}  // namespace tether

#endif  // __TETHER_HOST_STORE__
