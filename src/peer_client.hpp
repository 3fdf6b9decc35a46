#pragma once

#include "transport/stream.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolmesh {

struct PeerToolInfo {
  std::string name;
  std::string category;
  std::string description;
  nlohmann::json input_schema;
};

// Dialing side of a session. Requests are sent one at a time and each waits
// for its response frame. The stream is borrowed and must outlive the client.
class PeerClient {
 public:
  explicit PeerClient(IStream* stream, std::size_t max_frame_bytes = 1024 * 1024);

  std::optional<nlohmann::json> Initialize(std::string* err);
  std::vector<PeerToolInfo> ListTools(std::string* err);
  std::optional<nlohmann::json> CallTool(const std::string& name, const nlohmann::json& arguments, std::string* err);

  // Returns the result member; a JSON-RPC error is reported through `err` and
  // last_error_code().
  std::optional<nlohmann::json> Rpc(const std::string& method, const nlohmann::json& params, std::string* err);
  bool Notify(const std::string& method, const nlohmann::json& params, std::string* err);
  // Sends `request` verbatim and returns the whole response envelope.
  std::optional<nlohmann::json> Exchange(const nlohmann::json& request, std::string* err);

  // Code of the most recent JSON-RPC error, 0 after a success. With several
  // threads issuing calls it reflects whichever call finished last.
  int last_error_code() const { return last_error_code_.load(); }

 private:
  IStream* stream_;
  std::size_t max_frame_bytes_;
  std::atomic<std::int64_t> next_id_{1};
  std::atomic<int> last_error_code_{0};
  std::mutex mu_;
};

}  // namespace toolmesh
