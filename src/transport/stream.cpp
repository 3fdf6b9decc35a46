#include "transport/stream.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

namespace toolmesh {
namespace {

static std::string ErrnoText(const char* op) {
  if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINPROGRESS) return std::string(op) + ": timed out";
  return std::string(op) + ": " + std::strerror(errno);
}

static bool ApplyIoTimeout(int fd, std::chrono::milliseconds timeout, std::string* err) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
      ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
    if (err) *err = ErrnoText("setsockopt");
    return false;
  }
  return true;
}

}  // namespace

FdStream::FdStream(int fd, std::string remote_address) : fd_(fd), remote_address_(std::move(remote_address)) {}

FdStream::~FdStream() {
  Close();
}

ReadStatus FdStream::ReadExact(std::size_t n, std::string* out, std::string* err) {
  out->clear();
  out->reserve(n);
  char buf[8192];
  while (out->size() < n) {
    if (fd_ < 0) {
      if (err) *err = "stream closed";
      return ReadStatus::kError;
    }
    const std::size_t want = std::min(sizeof(buf), n - out->size());
    ssize_t got = ::recv(fd_, buf, want, 0);
    if (got < 0) {
      if (errno == EINTR) continue;
      if (err) *err = ErrnoText("recv");
      return ReadStatus::kError;
    }
    if (got == 0) return out->empty() ? ReadStatus::kEof : ReadStatus::kTruncated;
    out->append(buf, static_cast<std::size_t>(got));
  }
  return ReadStatus::kOk;
}

bool FdStream::WriteAll(const std::string& data, std::string* err) {
  std::size_t off = 0;
  while (off < data.size()) {
    if (fd_ < 0) {
      if (err) *err = "stream closed";
      return false;
    }
    ssize_t n = ::send(fd_, data.data() + off, data.size() - off, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      if (err) *err = ErrnoText("send");
      return false;
    }
    off += static_cast<std::size_t>(n);
  }
  return true;
}

void FdStream::Close() {
  if (fd_ >= 0) ::close(fd_);
  fd_ = -1;
}

void FdStream::ShutdownWrite() {
  if (fd_ >= 0) ::shutdown(fd_, SHUT_WR);
}

void FdStream::Interrupt() {
  if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
}

bool FdStream::SetIoTimeout(std::chrono::milliseconds timeout, std::string* err) {
  if (fd_ < 0) {
    if (err) *err = "stream closed";
    return false;
  }
  return ApplyIoTimeout(fd_, timeout, err);
}

std::optional<int> TcpConnect(const std::string& host, int port, std::string* err, std::chrono::milliseconds timeout) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    if (err) *err = ErrnoText("socket");
    return std::nullopt;
  }
  // On Linux SO_SNDTIMEO also bounds a blocking connect.
  if (timeout.count() > 0 && !ApplyIoTimeout(fd, timeout, err)) {
    ::close(fd);
    return std::nullopt;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port));
  if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
    ::close(fd);
    if (err) *err = "invalid ipv4 address: " + host;
    return std::nullopt;
  }
  if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    if (err) *err = ErrnoText("connect");
    ::close(fd);
    return std::nullopt;
  }
  return fd;
}

}  // namespace toolmesh
