#include "jsonrpc.hpp"

namespace toolmesh::jsonrpc {

nlohmann::json Error::ToJson() const {
  nlohmann::json j;
  j["code"] = code;
  j["message"] = message;
  if (!data.is_null()) j["data"] = data;
  return j;
}

Error FrameTooLarge(std::size_t declared, std::size_t limit) {
  return {kFrameTooLarge, "frame_too_large", {{"length", declared}, {"max_frame_bytes", limit}}};
}

Error RateLimited(long long frames, long long limit) {
  return {kRateLimited, "rate_limited", {{"frames", frames}, {"max_frames", limit}}};
}

Error InitRequired(const std::string& method) {
  return {kInitRequired, "init_required", {{"method", method}}};
}

Error InvalidJsonRpc() {
  return {kInvalidRequest, "invalid_jsonrpc", {{"expected", kVersion}}};
}

Error ParseError(const std::string& detail) {
  return {kParseError, "parse_error", {{"detail", detail}}};
}

Error MethodNotFound(const std::string& method) {
  return {kMethodNotFound, "method_not_found", {{"method", method}}};
}

nlohmann::json MakeResult(const nlohmann::json& id, nlohmann::json result) {
  nlohmann::json j;
  j["jsonrpc"] = kVersion;
  j["id"] = id;
  j["result"] = std::move(result);
  return j;
}

nlohmann::json MakeError(const nlohmann::json& id, const Error& error) {
  nlohmann::json j;
  j["jsonrpc"] = kVersion;
  j["id"] = id;
  j["error"] = error.ToJson();
  return j;
}

nlohmann::json GetId(const nlohmann::json& message) {
  if (message.is_object() && message.contains("id")) return message["id"];
  return nullptr;
}

std::string GetMethod(const nlohmann::json& message) {
  if (message.is_object() && message.contains("method") && message["method"].is_string()) {
    return message["method"].get<std::string>();
  }
  return {};
}

nlohmann::json GetParams(const nlohmann::json& message) {
  if (message.is_object() && message.contains("params") && message["params"].is_object()) return message["params"];
  return nlohmann::json::object();
}

bool IsNotification(const nlohmann::json& message) {
  if (!message.is_object() || message.contains("id")) return false;
  return GetMethod(message).rfind("notifications/", 0) == 0;
}

bool HasValidVersion(const nlohmann::json& message) {
  if (!message.is_object() || !message.contains("jsonrpc")) return false;
  const auto& v = message["jsonrpc"];
  return v.is_string() && v.get<std::string>() == kVersion;
}

}  // namespace toolmesh::jsonrpc
