#pragma once

#include "transport/stream.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace toolmesh {

class RequestRouter;

struct PeerListenerOptions {
  std::string host = "0.0.0.0";
  int port = 0;
  std::size_t max_frame_bytes = 1024 * 1024;
  std::int64_t max_frames_per_session = 0;
};

// Accepts TCP streams and serves each one on its own thread with a fresh
// Session. Sessions never share state with each other.
class PeerListener {
 public:
  PeerListener(RequestRouter* router, PeerListenerOptions options);
  ~PeerListener();
  PeerListener(const PeerListener&) = delete;
  PeerListener& operator=(const PeerListener&) = delete;

  bool Start(std::string* err);
  // Stops accepting, interrupts open streams and joins every session thread.
  void Stop();

  // Valid after Start; resolves port 0 to the kernel-assigned port.
  int bound_port() const { return bound_port_; }
  std::size_t active_sessions() const;

 private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void AcceptLoop();
  void ServeConnection(std::shared_ptr<FdStream> stream, std::string session_id);
  void ReapFinishedLocked();

  RequestRouter* router_;
  PeerListenerOptions options_;
  int listen_fd_ = -1;
  int bound_port_ = 0;
  std::atomic<bool> running_{false};
  std::thread accept_thread_;

  mutable std::mutex mu_;
  std::vector<Worker> workers_;
  std::map<std::string, std::shared_ptr<FdStream>> streams_;
};

}  // namespace toolmesh
