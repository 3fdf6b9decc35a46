#include "config.hpp"
#include "http_gateway.hpp"
#include "peer_client.hpp"
#include "request_router.hpp"
#include "tool_manager.hpp"
#include "tools/builtin_tools.hpp"
#include "transport/multiaddr.hpp"
#include "transport/peer_listener.hpp"

#include <nlohmann/json.hpp>

#include <signal.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

static const char* BoolText(bool b) {
  return b ? "true" : "false";
}

static bool WriteAnnounceFile(const toolmesh::ServiceConfig& cfg, int port, std::string* err) {
  toolmesh::Multiaddr self;
  self.host = cfg.p2p.listen_host;
  self.port = port;
  self.peer_id = cfg.p2p.peer_id;

  nlohmann::json j;
  j["peer_id"] = cfg.p2p.peer_id;
  j["protocol"] = toolmesh::kProtocolId;
  j["multiaddrs"] = nlohmann::json::array({toolmesh::FormatMultiaddr(self)});
  j["discovery"] = cfg.discovery.ToJson();

  std::ofstream out(cfg.discovery.announce_file, std::ios::binary | std::ios::trunc);
  if (!out) {
    if (err) *err = "failed to open " + cfg.discovery.announce_file;
    return false;
  }
  out << j.dump(2) << "\n";
  if (!out) {
    if (err) *err = "failed to write " + cfg.discovery.announce_file;
    return false;
  }
  return true;
}

// Dials each bootstrap peer once, runs the handshake and reports how many
// tools it exposes. `timeout` bounds every socket operation so a silent peer
// cannot hold up startup.
static void ProbeBootstrapPeers(const std::vector<std::string>& peers,
                                std::chrono::milliseconds timeout,
                                std::size_t max_frame_bytes) {
  for (const auto& text : peers) {
    std::string err;
    auto addr = toolmesh::ParseMultiaddr(text, &err);
    if (!addr) {
      std::cout << "[p2p] bootstrap skipped addr=" << text << " error=" << err << "\n";
      continue;
    }
    auto stream = toolmesh::DialMultiaddr(*addr, &err, timeout);
    if (!stream) {
      std::cout << "[p2p] bootstrap dial failed addr=" << text << " error=" << err << "\n";
      continue;
    }
    toolmesh::PeerClient client(stream.get(), max_frame_bytes);
    auto info = client.Initialize(&err);
    if (!info) {
      std::cout << "[p2p] bootstrap initialize failed addr=" << text << " error=" << err << "\n";
      continue;
    }
    auto tools = client.ListTools(&err);
    std::string remote_id;
    if (info->contains("serverInfo") && (*info)["serverInfo"].is_object()) {
      remote_id = (*info)["serverInfo"].value("peer_id", "");
    }
    std::cout << "[p2p] bootstrap ok addr=" << text << " peer=" << remote_id << " tools=" << tools.size() << "\n";
  }
}

static int WaitForTerminationSignal(const sigset_t& set) {
  int sig = 0;
  if (sigwait(&set, &sig) != 0) return SIGTERM;
  return sig;
}

}  // namespace

int main() {
  std::cout.setf(std::ios::unitbuf);

  // Block before any thread starts so every thread inherits the mask and the
  // signals are only delivered to sigwait below.
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  auto cfg = toolmesh::LoadConfigFromEnv();

  std::cout << "[toolmesh] version=" << TOOLMESH_VERSION << " peer_id=" << cfg.p2p.peer_id
            << " protocol=" << toolmesh::kProtocolId << "\n";
  std::cout << "[config] p2p listen=" << cfg.p2p.listen_host << ":" << cfg.p2p.listen_port
            << " max_frames=" << cfg.limits.max_frames_per_session << " max_frame_bytes=" << cfg.limits.max_frame_bytes
            << "\n";
  std::cout << "[config] discovery mdns=" << BoolText(cfg.discovery.mdns) << " dht=" << BoolText(cfg.discovery.dht)
            << " rendezvous=" << BoolText(cfg.discovery.rendezvous) << " autonat=" << BoolText(cfg.discovery.autonat)
            << " relay=" << BoolText(cfg.discovery.relay) << " holepunch=" << BoolText(cfg.discovery.holepunch)
            << " bootstrap_peers=" << cfg.discovery.bootstrap_peers.size()
            << " bootstrap_timeout_ms=" << cfg.discovery.bootstrap_timeout_ms << "\n";
  std::cout << "[config] dispatch max_concurrent=" << cfg.dispatch.max_concurrent
            << " shutdown_timeout_ms=" << cfg.dispatch.shutdown_timeout_ms << "\n";
  std::cout << "[config] http enabled=" << BoolText(cfg.http.enabled) << " listen=" << cfg.http.host << ":"
            << cfg.http.port << " session_idle_ms=" << cfg.http.session_idle_timeout_ms
            << " max_sessions=" << cfg.http.max_sessions << "\n";

  toolmesh::HierarchicalToolManager tools;
  toolmesh::RegisterMetaTools(&tools, cfg.dispatch.max_concurrent);
  toolmesh::RegisterSystemTools(&tools, cfg.p2p.peer_id);

  toolmesh::RouterOptions router_options;
  router_options.peer_id = cfg.p2p.peer_id;
  toolmesh::RequestRouter router(&tools, router_options);

  toolmesh::PeerListenerOptions listen_options;
  listen_options.host = cfg.p2p.listen_host;
  listen_options.port = cfg.p2p.listen_port;
  listen_options.max_frame_bytes = cfg.limits.max_frame_bytes;
  listen_options.max_frames_per_session = cfg.limits.max_frames_per_session;
  toolmesh::PeerListener listener(&router, listen_options);

  std::string err;
  if (!listener.Start(&err)) {
    std::cout << "[p2p] start failed error=" << err << "\n";
    return 1;
  }

  std::unique_ptr<toolmesh::HttpGateway> gateway;
  if (cfg.http.enabled) {
    toolmesh::HttpGatewayOptions http_options;
    http_options.host = cfg.http.host;
    http_options.port = cfg.http.port;
    http_options.max_frame_bytes = cfg.limits.max_frame_bytes;
    http_options.max_frames_per_session = cfg.limits.max_frames_per_session;
    http_options.session_idle_timeout = std::chrono::milliseconds(cfg.http.session_idle_timeout_ms);
    http_options.max_sessions = cfg.http.max_sessions;
    gateway = std::make_unique<toolmesh::HttpGateway>(&router, http_options);
    if (!gateway->Start(&err)) {
      std::cout << "[http] start failed error=" << err << "\n";
      listener.Stop();
      return 1;
    }
  }

  if (!cfg.discovery.announce_file.empty()) {
    if (WriteAnnounceFile(cfg, listener.bound_port(), &err)) {
      std::cout << "[p2p] announce file=" << cfg.discovery.announce_file << "\n";
    } else {
      std::cout << "[p2p] announce failed error=" << err << "\n";
    }
  }
  ProbeBootstrapPeers(cfg.discovery.bootstrap_peers,
                      std::chrono::milliseconds(cfg.discovery.bootstrap_timeout_ms),
                      cfg.limits.max_frame_bytes);

  const int sig = WaitForTerminationSignal(signals);
  std::cout << "[toolmesh] signal=" << sig << " stopping\n";

  if (gateway) gateway->Stop();
  listener.Stop();
  auto report = tools.GracefulShutdown(std::chrono::milliseconds(cfg.dispatch.shutdown_timeout_ms));
  std::cout << "[toolmesh] exit shutdown=" << report.ToJson().dump() << "\n";
  return report.status == toolmesh::ShutdownStatus::kOk ? 0 : 1;
}
