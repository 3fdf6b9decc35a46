#include "session.hpp"

#include "frame_codec.hpp"
#include "request_router.hpp"
#include "transport/stream.hpp"

#include <cstdint>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <utility>

namespace toolmesh {
namespace {

static std::string Hex(uint64_t v) {
  std::ostringstream oss;
  oss << std::hex << v;
  return oss.str();
}

static uint64_t Rand64() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return rng();
}

static bool Reply(IStream* stream, const nlohmann::json& response, ServeStats* stats, const std::string& session_id) {
  std::string err;
  if (!WriteJsonFrame(stream, response, &err)) {
    std::cout << "[session] write failed id=" << session_id << " error=" << err << "\n";
    return false;
  }
  stats->responses_written++;
  return true;
}

}  // namespace

const char* SessionStateName(SessionState state) {
  switch (state) {
    case SessionState::kUninitialized:
      return "uninitialized";
    case SessionState::kReady:
      return "ready";
  }
  return "uninitialized";
}

Session::Session(std::string id, std::int64_t max_frames) : id_(std::move(id)), limiter_(max_frames) {}

void Session::MarkReady(nlohmann::json client_capabilities) {
  state_ = SessionState::kReady;
  client_capabilities_ = client_capabilities.is_object() ? std::move(client_capabilities) : nlohmann::json::object();
}

ServeStats ServeStream(IStream* stream, RequestRouter* router, Session* session, std::size_t max_frame_bytes) {
  ServeStats stats;
  for (;;) {
    auto frame = ReadFrame(stream, max_frame_bytes);
    switch (frame.status) {
      case FrameStatus::kMessage: {
        stats.frames_read++;
        auto response = router->Handle(session, frame.message);
        if (response && !Reply(stream, *response, &stats, session->id())) {
          stats.close_reason = "write_failed";
          return stats;
        }
        break;
      }
      case FrameStatus::kDecodeError:
        stats.frames_read++;
        if (!Reply(stream, jsonrpc::MakeError(nullptr, *frame.error), &stats, session->id())) {
          stats.close_reason = "write_failed";
          return stats;
        }
        break;
      case FrameStatus::kTooLarge:
        std::cout << "[session] frame_too_large id=" << session->id() << " length=" << frame.declared_length
                  << " max=" << max_frame_bytes << "\n";
        stats.close_reason =
            Reply(stream, jsonrpc::MakeError(nullptr, *frame.error), &stats, session->id()) ? "frame_too_large"
                                                                                          : "write_failed";
        return stats;
      case FrameStatus::kEndOfStream:
        stats.close_reason = "eof";
        return stats;
      case FrameStatus::kIoError:
        std::cout << "[session] read failed id=" << session->id() << " error=" << frame.io_error << "\n";
        stats.close_reason = "io_error";
        return stats;
    }
  }
}

std::string NewId(const std::string& prefix) {
  return prefix + Hex(Rand64()) + Hex(Rand64());
}

}  // namespace toolmesh
