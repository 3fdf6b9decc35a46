#include "frame_codec.hpp"

#include <limits>
#include <string>

namespace toolmesh {

std::string EncodeFrameHeader(std::uint32_t length) {
  std::string out(kFrameHeaderBytes, '\0');
  out[0] = static_cast<char>((length >> 24) & 0xFF);
  out[1] = static_cast<char>((length >> 16) & 0xFF);
  out[2] = static_cast<char>((length >> 8) & 0xFF);
  out[3] = static_cast<char>(length & 0xFF);
  return out;
}

std::uint32_t DecodeFrameHeader(const std::string& header) {
  std::uint32_t v = 0;
  for (std::size_t i = 0; i < kFrameHeaderBytes && i < header.size(); i++) {
    v = (v << 8) | static_cast<std::uint8_t>(header[i]);
  }
  return v;
}

bool WriteFrame(IStream* stream, const std::string& payload, std::string* err) {
  if (payload.size() > std::numeric_limits<std::uint32_t>::max()) {
    if (err) *err = "payload exceeds 4 GiB frame limit";
    return false;
  }
  std::string buf = EncodeFrameHeader(static_cast<std::uint32_t>(payload.size()));
  buf += payload;
  return stream->WriteAll(buf, err);
}

bool WriteJsonFrame(IStream* stream, const nlohmann::json& message, std::string* err) {
  std::string payload;
  try {
    payload = message.dump();
  } catch (const nlohmann::json::type_error&) {
    payload = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  }
  return WriteFrame(stream, payload, err);
}

FrameReadResult ReadFrame(IStream* stream, std::size_t max_frame_bytes) {
  FrameReadResult r;
  std::string header;
  std::string err;
  switch (stream->ReadExact(kFrameHeaderBytes, &header, &err)) {
    case ReadStatus::kOk:
      break;
    case ReadStatus::kEof:
    case ReadStatus::kTruncated:
      // A header cut short carries no request; treat it like a clean close.
      r.status = FrameStatus::kEndOfStream;
      return r;
    case ReadStatus::kError:
      r.status = FrameStatus::kIoError;
      r.io_error = err;
      return r;
  }

  r.declared_length = DecodeFrameHeader(header);
  if (r.declared_length > max_frame_bytes) {
    r.status = FrameStatus::kTooLarge;
    r.error = jsonrpc::FrameTooLarge(r.declared_length, max_frame_bytes);
    return r;
  }

  std::string payload;
  if (r.declared_length > 0) {
    auto st = stream->ReadExact(r.declared_length, &payload, &err);
    if (st != ReadStatus::kOk) {
      r.status = FrameStatus::kIoError;
      r.io_error = st == ReadStatus::kError ? err : "stream closed mid-frame";
      return r;
    }
  }

  auto j = nlohmann::json::parse(payload, nullptr, false);
  if (j.is_discarded()) {
    r.status = FrameStatus::kDecodeError;
    r.error = jsonrpc::ParseError("payload is not valid JSON");
    return r;
  }
  r.status = FrameStatus::kMessage;
  r.message = std::move(j);
  return r;
}

}  // namespace toolmesh
