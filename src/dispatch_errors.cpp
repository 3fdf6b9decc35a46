#include "dispatch_errors.hpp"

#include <utility>

namespace toolmesh {
namespace {

static std::string Summarize(const std::vector<DispatchFailure>& failures) {
  std::string out = std::to_string(failures.size()) + " dispatch calls failed";
  for (const auto& f : failures) {
    out += "; [" + std::to_string(f.index) + "] " + f.message;
  }
  return out;
}

}  // namespace

const char* DispatchErrorKindName(DispatchErrorKind kind) {
  switch (kind) {
    case DispatchErrorKind::kUnknownCategory:
      return "unknown_category";
    case DispatchErrorKind::kUnknownTool:
      return "unknown_tool";
    case DispatchErrorKind::kToolFailed:
      return "tool_failed";
    case DispatchErrorKind::kShuttingDown:
      return "shutting_down";
  }
  return "tool_failed";
}

AggregateDispatchError::AggregateDispatchError(std::vector<DispatchFailure> failures)
    : std::runtime_error(Summarize(failures)), failures_(std::move(failures)) {}

}  // namespace toolmesh
