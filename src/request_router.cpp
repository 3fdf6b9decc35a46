#include "request_router.hpp"

#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

namespace toolmesh {
namespace {

static std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string GetString(const nlohmann::json& params, const char* key) {
  if (params.contains(key) && params[key].is_string()) return params[key].get<std::string>();
  return {};
}

struct CallTarget {
  std::string category;
  std::string tool;
  nlohmann::json arguments = nlohmann::json::object();
};

// Accepts {category, name|tool}, a qualified "category/tool" name, or a bare
// tool name resolved against the registry.
static std::optional<CallTarget> ResolveCallTarget(HierarchicalToolManager* tools,
                                                   const nlohmann::json& params,
                                                   jsonrpc::Error* error) {
  CallTarget t;
  t.category = GetString(params, "category");
  t.tool = GetString(params, "name");
  if (t.tool.empty()) t.tool = GetString(params, "tool");
  if (t.tool.empty()) {
    *error = {jsonrpc::kInvalidParams, "missing or invalid 'name' in tools/call", nullptr};
    return std::nullopt;
  }

  if (params.contains("arguments") && params["arguments"].is_object()) {
    t.arguments = params["arguments"];
  } else if (params.contains("params") && params["params"].is_object()) {
    t.arguments = params["params"];
  }

  if (t.category.empty()) {
    auto slash = t.tool.find('/');
    if (slash != std::string::npos) {
      t.category = t.tool.substr(0, slash);
      t.tool = t.tool.substr(slash + 1);
    }
  }
  if (t.category.empty()) {
    auto resolved = tools->ResolveToolCategory(t.tool);
    if (!resolved) {
      *error = {jsonrpc::kInvalidParams, "unknown tool: " + t.tool,
                {{"kind", DispatchErrorKindName(DispatchErrorKind::kUnknownTool)}}};
      return std::nullopt;
    }
    t.category = *resolved;
  }
  return t;
}

}  // namespace

RequestRouter::RequestRouter(HierarchicalToolManager* tools, RouterOptions options)
    : tools_(tools), options_(std::move(options)) {}

std::optional<nlohmann::json> RequestRouter::Handle(Session* session, const nlohmann::json& request) {
  auto response = Route(session, request);
  if (jsonrpc::IsNotification(request)) return std::nullopt;
  return response;
}

nlohmann::json RequestRouter::Route(Session* session, const nlohmann::json& request) {
  const auto id = jsonrpc::GetId(request);

  if (!jsonrpc::HasValidVersion(request)) return jsonrpc::MakeError(id, jsonrpc::InvalidJsonRpc());

  auto& limiter = session->limiter();
  if (!limiter.Admit()) {
    std::cout << "[session] rate_limited id=" << session->id() << " frames=" << limiter.frames_processed()
              << " max=" << limiter.max_frames() << "\n";
    return jsonrpc::MakeError(id, jsonrpc::RateLimited(limiter.frames_processed(), limiter.max_frames()));
  }

  const auto method = jsonrpc::GetMethod(request);
  if (!session->initialized() && method != "initialize") {
    return jsonrpc::MakeError(id, jsonrpc::InitRequired(method));
  }

  const auto params = jsonrpc::GetParams(request);
  if (method == "initialize") return HandleInitialize(session, id, params);
  if (method == "tools/list") return HandleToolsList(id);
  if (method == "tools/call") return HandleToolsCall(id, params);
  if (StartsWith(method, "notifications/")) return jsonrpc::MakeResult(id, nlohmann::json::object());
  return jsonrpc::MakeError(id, jsonrpc::MethodNotFound(method));
}

nlohmann::json RequestRouter::HandleInitialize(Session* session, const nlohmann::json& id, const nlohmann::json& params) {
  // Capabilities are recorded but not negotiated.
  nlohmann::json capabilities = nlohmann::json::object();
  if (params.contains("capabilities") && params["capabilities"].is_object()) capabilities = params["capabilities"];
  const bool again = session->initialized();
  session->MarkReady(std::move(capabilities));
  std::cout << "[session] initialize id=" << session->id() << " repeat=" << (again ? 1 : 0) << "\n";

  nlohmann::json result;
  result["ok"] = true;
  result["protocolVersion"] = kProtocolId;
  result["serverInfo"] = {
      {"name", options_.server_name}, {"version", options_.server_version}, {"peer_id", options_.peer_id}};
  result["capabilities"] = {{"tools", nlohmann::json::object()}};
  return jsonrpc::MakeResult(id, std::move(result));
}

nlohmann::json RequestRouter::HandleToolsList(const nlohmann::json& id) {
  nlohmann::json tools = nlohmann::json::array();
  try {
    for (const auto& t : tools_->ListAllTools()) {
      tools.push_back({{"name", t.schema.name},
                       {"category", t.category},
                       {"description", t.schema.description},
                       {"input_schema", t.schema.input_schema.is_null() ? nlohmann::json{{"type", "object"}}
                                                                        : t.schema.input_schema}});
    }
  } catch (const std::exception& e) {
    return jsonrpc::MakeError(id, {jsonrpc::kInternalError, e.what(), nullptr});
  }
  return jsonrpc::MakeResult(id, {{"tools", std::move(tools)}});
}

nlohmann::json RequestRouter::HandleToolsCall(const nlohmann::json& id, const nlohmann::json& params) {
  jsonrpc::Error error;
  std::optional<CallTarget> target;
  try {
    target = ResolveCallTarget(tools_, params, &error);
  } catch (const std::exception& e) {
    return jsonrpc::MakeError(id, {jsonrpc::kInternalError, e.what(), nullptr});
  }
  if (!target) return jsonrpc::MakeError(id, error);

  try {
    auto result = tools_->Dispatch(target->category, target->tool, target->arguments);
    return jsonrpc::MakeResult(id, std::move(result));
  } catch (const DispatchError& e) {
    std::cout << "[dispatch] error category=" << target->category << " tool=" << target->tool
              << " kind=" << DispatchErrorKindName(e.kind()) << " error=" << e.what()
              << " arguments=" << TruncateForLog(target->arguments.dump(), 512) << "\n";
    const bool lookup = e.kind() == DispatchErrorKind::kUnknownCategory || e.kind() == DispatchErrorKind::kUnknownTool;
    return jsonrpc::MakeError(id, {lookup ? jsonrpc::kInvalidParams : jsonrpc::kInternalError, e.what(),
                                   {{"kind", DispatchErrorKindName(e.kind())}}});
  } catch (const std::exception& e) {
    std::cout << "[dispatch] error category=" << target->category << " tool=" << target->tool << " error=" << e.what()
              << "\n";
    return jsonrpc::MakeError(id, {jsonrpc::kInternalError, e.what(), nullptr});
  }
}

}  // namespace toolmesh
