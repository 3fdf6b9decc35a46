#pragma once

#include "jsonrpc.hpp"
#include "session.hpp"
#include "tool_manager.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

#ifndef TOOLMESH_VERSION
#define TOOLMESH_VERSION "0.0.0"
#endif

namespace toolmesh {

inline constexpr const char* kProtocolId = "/toolmesh/mcp/1.0.0";

struct RouterOptions {
  std::string server_name = "toolmesh";
  std::string server_version = TOOLMESH_VERSION;
  std::string peer_id;
};

// Validates and answers one decoded request for a session. Checks run in a
// fixed order: protocol version, frame budget, handshake, then the method.
// Never throws; every failure comes back as a JSON-RPC error response.
class RequestRouter {
 public:
  explicit RequestRouter(HierarchicalToolManager* tools, RouterOptions options = {});

  // nullopt for notifications, which get no response.
  std::optional<nlohmann::json> Handle(Session* session, const nlohmann::json& request);

  const RouterOptions& options() const { return options_; }

 private:
  nlohmann::json Route(Session* session, const nlohmann::json& request);
  nlohmann::json HandleInitialize(Session* session, const nlohmann::json& id, const nlohmann::json& params);
  nlohmann::json HandleToolsList(const nlohmann::json& id);
  nlohmann::json HandleToolsCall(const nlohmann::json& id, const nlohmann::json& params);

  HierarchicalToolManager* tools_;
  RouterOptions options_;
};

}  // namespace toolmesh
