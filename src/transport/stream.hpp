#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace toolmesh {

enum class ReadStatus {
  kOk,
  kEof,        // peer closed before the first byte
  kTruncated,  // peer closed part way through
  kError,
};

class IStream {
 public:
  virtual ~IStream() = default;

  // Blocks until exactly `n` bytes are read into `out` or the stream ends.
  virtual ReadStatus ReadExact(std::size_t n, std::string* out, std::string* err) = 0;
  virtual bool WriteAll(const std::string& data, std::string* err) = 0;
  virtual void Close() = 0;
  virtual std::string RemoteAddress() const { return {}; }
};

// Owns a connected POSIX socket.
class FdStream : public IStream {
 public:
  explicit FdStream(int fd, std::string remote_address = {});
  ~FdStream() override;
  FdStream(const FdStream&) = delete;
  FdStream& operator=(const FdStream&) = delete;

  ReadStatus ReadExact(std::size_t n, std::string* out, std::string* err) override;
  bool WriteAll(const std::string& data, std::string* err) override;
  void Close() override;
  std::string RemoteAddress() const override { return remote_address_; }

  // Half-closes the write side so the peer sees end-of-stream.
  void ShutdownWrite();
  // Unblocks a reader on another thread. The descriptor stays open until Close.
  void Interrupt();
  // Bounds every later send and recv. Zero means block indefinitely.
  bool SetIoTimeout(std::chrono::milliseconds timeout, std::string* err);
  int fd() const { return fd_; }

 private:
  int fd_ = -1;
  std::string remote_address_;
};

// A non-zero `timeout` bounds the connect and stays on the socket as its send
// and receive timeout.
std::optional<int> TcpConnect(const std::string& host,
                              int port,
                              std::string* err,
                              std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

}  // namespace toolmesh
