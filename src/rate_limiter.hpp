#pragma once

#include <cstdint>

namespace toolmesh {

// Hard cap on the number of frames a single session may have processed over
// its lifetime. A limit of 0 disables the cap. Not thread-safe: each session
// owns its own instance.
class FrameRateLimiter {
 public:
  explicit FrameRateLimiter(std::int64_t max_frames = 0) : max_frames_(max_frames) {}

  // Counts one frame. Returns false when the frame is over the limit.
  bool Admit();

  std::int64_t frames_processed() const { return frames_processed_; }
  std::int64_t max_frames() const { return max_frames_; }
  bool unlimited() const { return max_frames_ <= 0; }

 private:
  std::int64_t max_frames_;
  std::int64_t frames_processed_ = 0;
};

}  // namespace toolmesh
