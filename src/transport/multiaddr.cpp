#include "transport/multiaddr.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cerrno>
#include <cstdlib>
#include <string>
#include <vector>

namespace toolmesh {
namespace {

static std::vector<std::string> SplitPath(const std::string& s) {
  std::vector<std::string> parts;
  std::string cur;
  for (size_t i = 1; i < s.size(); i++) {
    if (s[i] == '/') {
      parts.push_back(cur);
      cur.clear();
      continue;
    }
    cur.push_back(s[i]);
  }
  parts.push_back(cur);
  return parts;
}

static bool IsIpv4(const std::string& host) {
  in_addr tmp{};
  return ::inet_pton(AF_INET, host.c_str(), &tmp) == 1;
}

}  // namespace

std::optional<Multiaddr> ParseMultiaddr(const std::string& text, std::string* err) {
  auto fail = [&](const std::string& why) -> std::optional<Multiaddr> {
    if (err) *err = why + ": " + text;
    return std::nullopt;
  };
  if (text.empty() || text.front() != '/') return fail("multiaddr must start with '/'");

  auto parts = SplitPath(text);
  if (parts.size() != 4 && parts.size() != 6) return fail("unsupported multiaddr");
  if (parts[0] != "ip4") return fail("expected /ip4");
  if (parts[2] != "tcp") return fail("expected /tcp");

  Multiaddr out;
  out.host = parts[1];
  if (!IsIpv4(out.host)) return fail("invalid ipv4 address");

  errno = 0;
  char* end = nullptr;
  const long port = std::strtol(parts[3].c_str(), &end, 10);
  if (parts[3].empty() || errno != 0 || *end != '\0' || port <= 0 || port > 65535) return fail("invalid tcp port");
  out.port = static_cast<int>(port);

  if (parts.size() == 6) {
    if (parts[4] != "p2p") return fail("expected /p2p");
    if (parts[5].empty()) return fail("empty peer id");
    out.peer_id = parts[5];
  }
  return out;
}

std::string FormatMultiaddr(const Multiaddr& addr) {
  std::string s = "/ip4/" + addr.host + "/tcp/" + std::to_string(addr.port);
  if (!addr.peer_id.empty()) s += "/p2p/" + addr.peer_id;
  return s;
}

std::unique_ptr<FdStream> DialMultiaddr(const Multiaddr& addr, std::string* err, std::chrono::milliseconds io_timeout) {
  auto fd = TcpConnect(addr.host, addr.port, err, io_timeout);
  if (!fd) return nullptr;
  return std::make_unique<FdStream>(*fd, FormatMultiaddr(addr));
}

}  // namespace toolmesh
