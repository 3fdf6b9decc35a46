#pragma once

#include "transport/stream.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace toolmesh {

// The subset of multiaddr the TCP transport speaks:
// /ip4/<host>/tcp/<port>[/p2p/<peer-id>]
struct Multiaddr {
  std::string host;
  int port = 0;
  std::string peer_id;
};

std::optional<Multiaddr> ParseMultiaddr(const std::string& text, std::string* err);
std::string FormatMultiaddr(const Multiaddr& addr);

// A non-zero `io_timeout` bounds the connect and every later read and write.
std::unique_ptr<FdStream> DialMultiaddr(const Multiaddr& addr,
                                        std::string* err,
                                        std::chrono::milliseconds io_timeout = std::chrono::milliseconds(0));

}  // namespace toolmesh
