#include "peer_client.hpp"

#include "frame_codec.hpp"
#include "jsonrpc.hpp"

#include <string>
#include <utility>

namespace toolmesh {
namespace {

static std::string ExtractJsonRpcError(const nlohmann::json& resp, int* code) {
  if (!resp.is_object()) return "invalid json-rpc response";
  if (!resp.contains("error") || !resp["error"].is_object()) return {};
  const auto& e = resp["error"];
  if (e.contains("code") && e["code"].is_number_integer()) *code = e["code"].get<int>();
  std::string msg;
  if (e.contains("message") && e["message"].is_string()) msg = e["message"].get<std::string>();
  if (msg.empty()) msg = "json-rpc error";
  return msg;
}

}  // namespace

PeerClient::PeerClient(IStream* stream, std::size_t max_frame_bytes)
    : stream_(stream), max_frame_bytes_(max_frame_bytes) {}

std::optional<nlohmann::json> PeerClient::Initialize(std::string* err) {
  nlohmann::json params;
  params["capabilities"] = nlohmann::json::object();
  params["clientInfo"] = {{"name", "toolmesh-client"}, {"version", "0.1.0"}};
  return Rpc("initialize", params, err);
}

std::vector<PeerToolInfo> PeerClient::ListTools(std::string* err) {
  std::vector<PeerToolInfo> out;
  auto r = Rpc("tools/list", nlohmann::json::object(), err);
  if (!r) return {};
  if (!r->contains("tools") || !(*r)["tools"].is_array()) return out;
  for (const auto& t : (*r)["tools"]) {
    if (!t.is_object()) continue;
    PeerToolInfo info;
    if (t.contains("name") && t["name"].is_string()) info.name = t["name"].get<std::string>();
    if (t.contains("category") && t["category"].is_string()) info.category = t["category"].get<std::string>();
    if (t.contains("description") && t["description"].is_string()) info.description = t["description"].get<std::string>();
    if (t.contains("input_schema") && t["input_schema"].is_object()) info.input_schema = t["input_schema"];
    if (!info.name.empty()) out.push_back(std::move(info));
  }
  return out;
}

std::optional<nlohmann::json> PeerClient::CallTool(const std::string& name,
                                                   const nlohmann::json& arguments,
                                                   std::string* err) {
  nlohmann::json params;
  params["name"] = name;
  params["arguments"] = arguments;
  return Rpc("tools/call", params, err);
}

std::optional<nlohmann::json> PeerClient::Exchange(const nlohmann::json& request, std::string* err) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!WriteJsonFrame(stream_, request, err)) return std::nullopt;
  auto frame = ReadFrame(stream_, max_frame_bytes_);
  switch (frame.status) {
    case FrameStatus::kMessage:
      return std::move(frame.message);
    case FrameStatus::kEndOfStream:
      if (err) *err = "peer closed the stream";
      return std::nullopt;
    case FrameStatus::kTooLarge:
    case FrameStatus::kDecodeError:
      if (err) *err = frame.error ? frame.error->message : "invalid response frame";
      return std::nullopt;
    case FrameStatus::kIoError:
      if (err) *err = frame.io_error;
      return std::nullopt;
  }
  if (err) *err = "invalid response frame";
  return std::nullopt;
}

std::optional<nlohmann::json> PeerClient::Rpc(const std::string& method,
                                              const nlohmann::json& params,
                                              std::string* err) {
  nlohmann::json req;
  req["jsonrpc"] = jsonrpc::kVersion;
  req["id"] = next_id_.fetch_add(1);
  req["method"] = method;
  req["params"] = params;

  last_error_code_.store(0);
  auto resp = Exchange(req, err);
  if (!resp) return std::nullopt;

  int code = 0;
  auto rpc_err = ExtractJsonRpcError(*resp, &code);
  if (!rpc_err.empty()) {
    last_error_code_.store(code);
    if (err) *err = rpc_err;
    return std::nullopt;
  }
  if (!resp->contains("result")) {
    if (err) *err = "missing result";
    return std::nullopt;
  }
  return (*resp)["result"];
}

bool PeerClient::Notify(const std::string& method, const nlohmann::json& params, std::string* err) {
  nlohmann::json req;
  req["jsonrpc"] = jsonrpc::kVersion;
  req["method"] = method;
  req["params"] = params;
  std::lock_guard<std::mutex> lock(mu_);
  return WriteJsonFrame(stream_, req, err);
}

}  // namespace toolmesh
