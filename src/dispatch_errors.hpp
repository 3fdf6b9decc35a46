#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace toolmesh {

enum class DispatchErrorKind {
  kUnknownCategory,
  kUnknownTool,
  kToolFailed,
  kShuttingDown,
};

const char* DispatchErrorKindName(DispatchErrorKind kind);

class DispatchError : public std::runtime_error {
 public:
  DispatchError(DispatchErrorKind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}
  DispatchErrorKind kind() const { return kind_; }

 private:
  DispatchErrorKind kind_;
};

class UnknownCategoryError : public DispatchError {
 public:
  explicit UnknownCategoryError(const std::string& category)
      : DispatchError(DispatchErrorKind::kUnknownCategory, "unknown category: " + category) {}
};

class UnknownToolError : public DispatchError {
 public:
  UnknownToolError(const std::string& category, const std::string& tool)
      : DispatchError(DispatchErrorKind::kUnknownTool, "unknown tool: " + category + "/" + tool) {}
};

class ToolExecutionError : public DispatchError {
 public:
  explicit ToolExecutionError(const std::string& message) : DispatchError(DispatchErrorKind::kToolFailed, message) {}
};

class ShuttingDownError : public DispatchError {
 public:
  ShuttingDownError() : DispatchError(DispatchErrorKind::kShuttingDown, "tool manager is shutting down") {}
};

// Per-item failure carried by parallel dispatch.
struct DispatchFailure {
  DispatchErrorKind kind = DispatchErrorKind::kToolFailed;
  std::string message;
  std::size_t index = 0;  // position of the call in the submitted list
};

// Raised by fail-fast parallel dispatch. Holds every failure of the batch
// that stopped the run, in input order.
class AggregateDispatchError : public std::runtime_error {
 public:
  explicit AggregateDispatchError(std::vector<DispatchFailure> failures);
  const std::vector<DispatchFailure>& failures() const { return failures_; }

 private:
  std::vector<DispatchFailure> failures_;
};

}  // namespace toolmesh
