#include "HostStore.hpp"

namespace tether {
namespace {
const int HOST_STORE_VERSION = 1;
}

HostStore::HostStore(const string& _path) : path(_path) {
  hosts.set_version(HOST_STORE_VERSION);
}

string HostStore::defaultPath() {
  return (fs::path(sago::getConfigHome()) / "tether" / "hosts.pb").string();
}

void HostStore::load() {
  lock_guard<recursive_mutex> guard(classMutex);
  hosts.Clear();
  hosts.set_version(HOST_STORE_VERSION);
  if (!fs::exists(path)) {
    VLOG(1) << "No host store at " << path;
    return;
  }
  ifstream in(path, ios::in | ios::binary);
  if (!in) {
    throw std::runtime_error("Cannot open host store " + path + ": " +
                             strerror(errno));
  }
  string contents((istreambuf_iterator<char>(in)),
                  istreambuf_iterator<char>());
  KnownHostList loaded;
  if (!loaded.ParseFromString(contents)) {
    throw std::runtime_error("Host store " + path +
                             " is corrupt; move it aside to start over");
  }
  if (loaded.version() > HOST_STORE_VERSION) {
    throw std::runtime_error("Host store " + path +
                             " was written by a newer version");
  }
  hosts = loaded;
  LOG(INFO) << "Loaded " << hosts.hosts_size() << " known hosts";
}

vector<KnownHost> HostStore::list() {
  lock_guard<recursive_mutex> guard(classMutex);
  vector<KnownHost> result(hosts.hosts().begin(), hosts.hosts().end());
  sort(result.begin(), result.end(),
       [](const KnownHost& a, const KnownHost& b) {
         if (a.last_connected_ms() != b.last_connected_ms()) {
           return a.last_connected_ms() > b.last_connected_ms();
         }
         return a.name() < b.name();
       });
  return result;
}

optional<KnownHost> HostStore::get(const string& nameOrId) {
  lock_guard<recursive_mutex> guard(classMutex);
  int index = find(nameOrId);
  if (index < 0) {
    return nullopt;
  }
  return hosts.hosts(index);
}

KnownHost HostStore::save(const string& name,
                          const ConnectionDescriptor& descriptor) {
  if (trim(name).empty()) {
    throw std::runtime_error("Host name cannot be empty");
  }
  lock_guard<recursive_mutex> guard(classMutex);
  KnownHost* host = NULL;
  for (int a = 0; a < hosts.hosts_size(); a++) {
    if (hosts.hosts(a).name() == name) {
      host = hosts.mutable_hosts(a);
      break;
    }
  }
  if (host == NULL) {
    host = hosts.add_hosts();
    host->set_id(descriptor.getHost() + ":" + to_string(descriptor.getPort()) +
                 "-" + to_string(currentTimeMillis()));
    host->set_name(name);
  }
  host->set_host(descriptor.getHost());
  host->set_port(descriptor.getPort());
  host->set_token(descriptor.getSessionToken());
  host->set_scheme(descriptor.isSecure() ? SCHEME_WSS : SCHEME_WS);
  KnownHost saved = *host;
  persist();
  return saved;
}

bool HostStore::touch(const string& id, const vector<string>& capabilities) {
  lock_guard<recursive_mutex> guard(classMutex);
  int index = find(id);
  if (index < 0) {
    return false;
  }
  KnownHost* host = hosts.mutable_hosts(index);
  host->set_last_connected_ms(currentTimeMillis());
  host->clear_capabilities();
  for (const auto& it : capabilities) {
    host->add_capabilities(it);
  }
  persist();
  return true;
}

bool HostStore::rename(const string& id, const string& newName) {
  if (trim(newName).empty()) {
    throw std::runtime_error("Host name cannot be empty");
  }
  lock_guard<recursive_mutex> guard(classMutex);
  int index = find(id);
  if (index < 0) {
    return false;
  }
  int clash = find(newName);
  if (clash >= 0 && clash != index) {
    throw std::runtime_error("A host named '" + newName + "' already exists");
  }
  hosts.mutable_hosts(index)->set_name(newName);
  persist();
  return true;
}

bool HostStore::remove(const string& nameOrId) {
  lock_guard<recursive_mutex> guard(classMutex);
  int index = find(nameOrId);
  if (index < 0) {
    return false;
  }
  hosts.mutable_hosts()->DeleteSubrange(index, 1);
  persist();
  return true;
}

ConnectionDescriptor HostStore::toDescriptor(const KnownHost& host) {
  return ConnectionDescriptor(
      host.host(), host.has_port() ? host.port() : DEFAULT_RELAY_PORT,
      host.token(), host.scheme() == SCHEME_WSS ? Scheme::WSS : Scheme::WS);
}

int HostStore::find(const string& nameOrId) {
  // Ids win over names.
  for (int a = 0; a < hosts.hosts_size(); a++) {
    if (hosts.hosts(a).id() == nameOrId) {
      return a;
    }
  }
  for (int a = 0; a < hosts.hosts_size(); a++) {
    if (hosts.hosts(a).name() == nameOrId) {
      return a;
    }
  }
  return -1;
}

void HostStore::persist() {
  fs::path target(path);
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path());
  }
  string tmpPath = path + ".tmp";
  {
    ofstream out(tmpPath, ios::out | ios::binary | ios::trunc);
    if (!out) {
      throw std::runtime_error("Cannot write host store " + tmpPath + ": " +
                               strerror(errno));
    }
    fs::permissions(tmpPath, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace);
    out << protoToString(hosts);
    if (!out.flush()) {
      throw std::runtime_error("Cannot write host store " + tmpPath);
    }
  }
  fs::rename(tmpPath, target);
}
}  // namespace tether
