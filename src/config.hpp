#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace toolmesh {

struct P2PListenConfig {
  std::string listen_host = "0.0.0.0";
  int listen_port = 4011;
  std::string peer_id;
};

// Discovery toggles are carried through to the announce record; the core does
// not act on them.
struct DiscoveryConfig {
  bool mdns = true;
  bool dht = false;
  bool rendezvous = false;
  bool autonat = false;
  bool relay = false;
  bool holepunch = false;
  std::vector<std::string> bootstrap_peers;
  // Bounds connect, send and receive on each bootstrap dial.
  std::int64_t bootstrap_timeout_ms = 5000;
  std::string announce_file;

  nlohmann::json ToJson() const;
};

struct SessionLimits {
  std::int64_t max_frames_per_session = 0;
  std::size_t max_frame_bytes = 1024 * 1024;
};

struct DispatchConfig {
  int max_concurrent = 8;
  std::int64_t shutdown_timeout_ms = 30000;
};

struct HttpListenConfig {
  bool enabled = false;
  std::string host = "127.0.0.1";
  int port = 8090;
  std::int64_t session_idle_timeout_ms = 10 * 60 * 1000;
  std::size_t max_sessions = 1024;
};

struct ServiceConfig {
  P2PListenConfig p2p;
  DiscoveryConfig discovery;
  SessionLimits limits;
  DispatchConfig dispatch;
  HttpListenConfig http;
};

ServiceConfig LoadConfigFromEnv();

}  // namespace toolmesh
