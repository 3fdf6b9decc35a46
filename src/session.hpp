#pragma once

#include "rate_limiter.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace toolmesh {

class IStream;
class RequestRouter;

enum class SessionState {
  kUninitialized,
  kReady,
};

const char* SessionStateName(SessionState state);

// Per-stream protocol state. Owned by the task serving the stream and never
// shared with other sessions.
class Session {
 public:
  explicit Session(std::string id, std::int64_t max_frames = 0);

  const std::string& id() const { return id_; }
  SessionState state() const { return state_; }
  bool initialized() const { return state_ == SessionState::kReady; }

  // Re-running the handshake on a ready session is allowed and only refreshes
  // the recorded client capabilities.
  void MarkReady(nlohmann::json client_capabilities);
  const nlohmann::json& client_capabilities() const { return client_capabilities_; }

  FrameRateLimiter& limiter() { return limiter_; }
  std::int64_t frames_processed() const { return limiter_.frames_processed(); }

 private:
  std::string id_;
  SessionState state_ = SessionState::kUninitialized;
  FrameRateLimiter limiter_;
  nlohmann::json client_capabilities_ = nlohmann::json::object();
};

struct ServeStats {
  std::int64_t frames_read = 0;
  std::int64_t responses_written = 0;
  std::string close_reason;
};

// Reads frames off `stream` until it closes, routing each one in arrival
// order and writing responses back. An oversized frame is answered once and
// ends the session without reading its payload.
ServeStats ServeStream(IStream* stream, RequestRouter* router, Session* session, std::size_t max_frame_bytes);

std::string NewId(const std::string& prefix);

}  // namespace toolmesh
