#include "transport/peer_listener.hpp"

#include "request_router.hpp"
#include "session.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>

namespace toolmesh {
namespace {

constexpr auto kAcceptBackoff = std::chrono::milliseconds(10);

static std::string ErrnoText(const char* op) {
  return std::string(op) + ": " + std::strerror(errno);
}

static std::string FormatPeer(const sockaddr_in& addr) {
  char buf[INET_ADDRSTRLEN] = {0};
  ::inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf));
  return std::string(buf) + ":" + std::to_string(ntohs(addr.sin_port));
}

}  // namespace

PeerListener::PeerListener(RequestRouter* router, PeerListenerOptions options)
    : router_(router), options_(std::move(options)) {}

PeerListener::~PeerListener() {
  Stop();
}

bool PeerListener::Start(std::string* err) {
  if (running_.load()) return true;

  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    if (err) *err = ErrnoText("socket");
    return false;
  }
  int one = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(options_.port));
  if (::inet_pton(AF_INET, options_.host.c_str(), &addr.sin_addr) <= 0) {
    ::close(fd);
    if (err) *err = "invalid listen host: " + options_.host;
    return false;
  }
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    if (err) *err = ErrnoText("bind");
    ::close(fd);
    return false;
  }
  if (::listen(fd, 64) < 0) {
    if (err) *err = ErrnoText("listen");
    ::close(fd);
    return false;
  }

  sockaddr_in bound{};
  socklen_t len = sizeof(bound);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
    bound_port_ = ntohs(bound.sin_port);
  } else {
    bound_port_ = options_.port;
  }

  listen_fd_ = fd;
  running_.store(true);
  accept_thread_ = std::thread([this]() { AcceptLoop(); });
  std::cout << "[p2p] listen host=" << options_.host << " port=" << bound_port_ << "\n";
  return true;
}

void PeerListener::AcceptLoop() {
  while (running_.load()) {
    sockaddr_in peer{};
    socklen_t len = sizeof(peer);
    int fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&peer), &len);
    if (fd < 0) {
      const int e = errno;
      if (!running_.load()) break;
      if (e == EINTR) continue;
      // Descriptor exhaustion and aborted handshakes pass; keep listening.
      std::cout << "[p2p] accept failed error=" << std::strerror(e) << "\n";
      std::this_thread::sleep_for(kAcceptBackoff);
      continue;
    }

    auto stream = std::make_shared<FdStream>(fd, FormatPeer(peer));
    auto session_id = NewId("sess_");
    std::cout << "[p2p] accept peer=" << stream->RemoteAddress() << " session=" << session_id << "\n";

    std::lock_guard<std::mutex> lock(mu_);
    if (!running_.load()) break;
    ReapFinishedLocked();
    Worker w;
    w.done = std::make_shared<std::atomic<bool>>(false);
    streams_[session_id] = stream;
    try {
      w.thread = std::thread([this, stream, session_id, done = w.done]() {
        ServeConnection(stream, session_id);
        done->store(true);
      });
    } catch (const std::system_error& e) {
      streams_.erase(session_id);
      stream->Close();
      std::cout << "[p2p] session thread failed peer=" << stream->RemoteAddress() << " error=" << e.what() << "\n";
      continue;
    }
    workers_.push_back(std::move(w));
  }
}

void PeerListener::ServeConnection(std::shared_ptr<FdStream> stream, std::string session_id) {
  Session session(session_id, options_.max_frames_per_session);
  auto stats = ServeStream(stream.get(), router_, &session, options_.max_frame_bytes);
  {
    std::lock_guard<std::mutex> lock(mu_);
    streams_.erase(session_id);
  }
  stream->Close();
  std::cout << "[session] closed id=" << session_id << " frames=" << stats.frames_read
            << " responses=" << stats.responses_written << " reason=" << stats.close_reason << "\n";
}

void PeerListener::ReapFinishedLocked() {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->done->load()) {
      if (it->thread.joinable()) it->thread.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

void PeerListener::Stop() {
  if (!running_.exchange(false)) return;
  if (listen_fd_ >= 0) ::shutdown(listen_fd_, SHUT_RDWR);
  if (accept_thread_.joinable()) accept_thread_.join();
  if (listen_fd_ >= 0) ::close(listen_fd_);
  listen_fd_ = -1;

  std::vector<Worker> workers;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto& [_, s] : streams_) s->Interrupt();
    workers.swap(workers_);
  }
  for (auto& w : workers) {
    if (w.thread.joinable()) w.thread.join();
  }
  std::cout << "[p2p] stopped sessions_joined=" << workers.size() << "\n";
}

std::size_t PeerListener::active_sessions() const {
  std::lock_guard<std::mutex> lock(mu_);
  return streams_.size();
}

}  // namespace toolmesh
