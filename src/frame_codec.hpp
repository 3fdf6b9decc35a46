#pragma once

#include "jsonrpc.hpp"
#include "transport/stream.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace toolmesh {

inline constexpr std::size_t kFrameHeaderBytes = 4;
inline constexpr std::size_t kDefaultMaxFrameBytes = 1024 * 1024;

enum class FrameStatus {
  kMessage,      // `message` holds the decoded JSON value
  kEndOfStream,  // peer closed cleanly between frames
  kTooLarge,     // declared length over the limit; payload left unread
  kDecodeError,  // payload read in full but is not valid JSON
  kIoError,      // transport failure or peer closed mid-frame
};

struct FrameReadResult {
  FrameStatus status = FrameStatus::kIoError;
  nlohmann::json message;
  std::uint32_t declared_length = 0;
  // Set for kTooLarge and kDecodeError.
  std::optional<jsonrpc::Error> error;
  // Set for kIoError.
  std::string io_error;
};

std::string EncodeFrameHeader(std::uint32_t length);
std::uint32_t DecodeFrameHeader(const std::string& header);

bool WriteFrame(IStream* stream, const std::string& payload, std::string* err);
bool WriteJsonFrame(IStream* stream, const nlohmann::json& message, std::string* err);
FrameReadResult ReadFrame(IStream* stream, std::size_t max_frame_bytes);

}  // namespace toolmesh
