#include "config.hpp"

#include "session.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <string>
#include <vector>

namespace toolmesh {
namespace {

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::vector<std::string> SplitCsv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
      continue;
    }
    cur.push_back(c);
  }
  if (!cur.empty()) out.push_back(cur);
  for (auto& v : out) {
    while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) v.erase(v.begin());
    while (!v.empty() && (v.back() == ' ' || v.back() == '\t')) v.pop_back();
  }
  std::vector<std::string> filtered;
  for (auto& v : out) {
    if (!v.empty()) filtered.push_back(std::move(v));
  }
  return filtered;
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

static bool TryParseInt(const std::string& s, long long* out) {
  if (!out || s.empty()) return false;
  errno = 0;
  char* end = nullptr;
  const long long v = std::strtoll(s.c_str(), &end, 10);
  if (errno != 0 || end == s.c_str() || *end != '\0') return false;
  *out = v;
  return true;
}

static void ReadBool(const char* name, bool* field) {
  auto raw = GetEnvStr(name);
  if (raw.empty()) return;
  bool b = false;
  if (TryParseBool(raw, &b)) *field = b;
}

static void ReadPort(const char* name, int* field) {
  long long v = 0;
  if (TryParseInt(GetEnvStr(name), &v) && v >= 0 && v <= 65535) *field = static_cast<int>(v);
}

}  // namespace

nlohmann::json DiscoveryConfig::ToJson() const {
  return {{"mdns", mdns},
          {"dht", dht},
          {"rendezvous", rendezvous},
          {"autonat", autonat},
          {"relay", relay},
          {"holepunch", holepunch},
          {"bootstrap_peers", bootstrap_peers}};
}

ServiceConfig LoadConfigFromEnv() {
  ServiceConfig cfg;

  if (auto host = GetEnvStr("TOOLMESH_P2P_LISTEN_HOST"); !host.empty()) cfg.p2p.listen_host = host;
  ReadPort("TOOLMESH_P2P_LISTEN_PORT", &cfg.p2p.listen_port);
  if (auto id = GetEnvStr("TOOLMESH_P2P_PEER_ID"); !id.empty()) cfg.p2p.peer_id = id;
  if (cfg.p2p.peer_id.empty()) cfg.p2p.peer_id = NewId("peer-");

  ReadBool("TOOLMESH_P2P_ENABLE_MDNS", &cfg.discovery.mdns);
  ReadBool("TOOLMESH_P2P_ENABLE_DHT", &cfg.discovery.dht);
  ReadBool("TOOLMESH_P2P_ENABLE_RENDEZVOUS", &cfg.discovery.rendezvous);
  ReadBool("TOOLMESH_P2P_ENABLE_AUTONAT", &cfg.discovery.autonat);
  ReadBool("TOOLMESH_P2P_ENABLE_RELAY", &cfg.discovery.relay);
  ReadBool("TOOLMESH_P2P_ENABLE_HOLEPUNCH", &cfg.discovery.holepunch);
  if (auto peers = GetEnvStr("TOOLMESH_P2P_BOOTSTRAP_PEERS"); !peers.empty()) {
    cfg.discovery.bootstrap_peers = SplitCsv(peers);
  }
  if (auto f = GetEnvStr("TOOLMESH_P2P_ANNOUNCE_FILE"); !f.empty()) cfg.discovery.announce_file = f;

  long long v = 0;
  if (TryParseInt(GetEnvStr("TOOLMESH_P2P_BOOTSTRAP_TIMEOUT_MS"), &v) && v > 0) {
    cfg.discovery.bootstrap_timeout_ms = v;
  }
  if (TryParseInt(GetEnvStr("TOOLMESH_P2P_MAX_FRAMES"), &v) && v >= 0) cfg.limits.max_frames_per_session = v;
  if (TryParseInt(GetEnvStr("TOOLMESH_P2P_MAX_FRAME_BYTES"), &v) && v > 0) {
    cfg.limits.max_frame_bytes = static_cast<std::size_t>(v);
  }
  if (TryParseInt(GetEnvStr("TOOLMESH_DISPATCH_MAX_CONCURRENT"), &v)) {
    if (v < 1) v = 1;
    if (v > std::numeric_limits<int>::max()) v = std::numeric_limits<int>::max();
    cfg.dispatch.max_concurrent = static_cast<int>(v);
  }
  if (TryParseInt(GetEnvStr("TOOLMESH_SHUTDOWN_TIMEOUT_MS"), &v) && v >= 0) cfg.dispatch.shutdown_timeout_ms = v;

  ReadBool("TOOLMESH_HTTP_ENABLED", &cfg.http.enabled);
  if (auto host = GetEnvStr("TOOLMESH_HTTP_HOST"); !host.empty()) cfg.http.host = host;
  ReadPort("TOOLMESH_HTTP_PORT", &cfg.http.port);
  if (TryParseInt(GetEnvStr("TOOLMESH_HTTP_SESSION_IDLE_MS"), &v) && v > 0) cfg.http.session_idle_timeout_ms = v;
  if (TryParseInt(GetEnvStr("TOOLMESH_HTTP_MAX_SESSIONS"), &v) && v > 0) {
    cfg.http.max_sessions = static_cast<std::size_t>(v);
  }

  return cfg;
}

}  // namespace toolmesh
