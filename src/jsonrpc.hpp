#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace toolmesh::jsonrpc {

inline constexpr const char* kVersion = "2.0";

inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;
inline constexpr int kInitRequired = -32002;
inline constexpr int kFrameTooLarge = -32003;
inline constexpr int kRateLimited = -32010;

struct Error {
  int code = kInternalError;
  std::string message;
  nlohmann::json data;  // null when absent

  nlohmann::json ToJson() const;
};

Error FrameTooLarge(std::size_t declared, std::size_t limit);
Error RateLimited(long long frames, long long limit);
Error InitRequired(const std::string& method);
Error InvalidJsonRpc();
Error ParseError(const std::string& detail);
Error MethodNotFound(const std::string& method);

nlohmann::json MakeResult(const nlohmann::json& id, nlohmann::json result);
nlohmann::json MakeError(const nlohmann::json& id, const Error& error);

// Returns null when the message carries no id.
nlohmann::json GetId(const nlohmann::json& message);
std::string GetMethod(const nlohmann::json& message);
nlohmann::json GetParams(const nlohmann::json& message);
// True for id-less "notifications/..." messages, which never get a response.
bool IsNotification(const nlohmann::json& message);
bool HasValidVersion(const nlohmann::json& message);

}  // namespace toolmesh::jsonrpc
