#pragma once

#include "session.hpp"

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace toolmesh {

class RequestRouter;

inline constexpr const char* kSessionHeader = "Mcp-Session-Id";

struct HttpGatewayOptions {
  std::string host = "127.0.0.1";
  int port = 8090;
  std::size_t max_frame_bytes = 1024 * 1024;
  std::int64_t max_frames_per_session = 0;
  // Sessions untouched for this long are dropped when a new one is opened.
  std::chrono::milliseconds session_idle_timeout{10 * 60 * 1000};
  std::size_t max_sessions = 1024;
};

// Serves the same session protocol over HTTP. Each POST /mcp body is one
// request; the Mcp-Session-Id header ties requests to a session.
class HttpGateway {
 public:
  HttpGateway(RequestRouter* router, HttpGatewayOptions options);
  ~HttpGateway();
  HttpGateway(const HttpGateway&) = delete;
  HttpGateway& operator=(const HttpGateway&) = delete;

  // Binds and starts serving on a background thread. Port 0 picks a free port.
  bool Start(std::string* err);
  void Stop();

  int bound_port() const { return bound_port_; }
  std::size_t session_count() const;

 private:
  struct SessionSlot {
    explicit SessionSlot(std::string id, std::int64_t max_frames) : session(std::move(id), max_frames) {}
    std::mutex mu;
    Session session;
    std::chrono::steady_clock::time_point last_used;  // guarded by HttpGateway::mu_
  };

  void Register();
  void HandlePost(const httplib::Request& req, httplib::Response& res);
  void HandleDelete(const httplib::Request& req, httplib::Response& res);
  std::shared_ptr<SessionSlot> FindSession(const std::string& id);
  // Returns nullptr when max_sessions are live after idle ones are reaped.
  std::shared_ptr<SessionSlot> CreateSession();
  void ReapIdleLocked(std::chrono::steady_clock::time_point now);

  RequestRouter* router_;
  HttpGatewayOptions options_;
  httplib::Server server_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  int bound_port_ = 0;

  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<SessionSlot>> sessions_;
};

}  // namespace toolmesh
