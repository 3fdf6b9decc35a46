#include "rate_limiter.hpp"

namespace toolmesh {

bool FrameRateLimiter::Admit() {
  frames_processed_++;
  if (unlimited()) return true;
  return frames_processed_ <= max_frames_;
}

}  // namespace toolmesh
