#pragma once

#include "dispatch_errors.hpp"
#include "tool_category.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace toolmesh {

struct DispatchCall {
  std::string category;
  std::string tool;
  nlohmann::json params = nlohmann::json::object();
};

using DispatchOutcome = std::expected<nlohmann::json, DispatchFailure>;

// Success arm as-is; failure arm as {status: "error", error: <message>}.
nlohmann::json OutcomeToJson(const DispatchOutcome& outcome);

struct CategoryInfo {
  std::string name;
  std::string description;
  std::optional<std::size_t> tool_count;
};

struct ToolListing {
  std::string category;
  ToolSchema schema;
};

enum class ShutdownStatus { kOk, kTimeout };

struct ShutdownReport {
  ShutdownStatus status = ShutdownStatus::kOk;
  std::size_t categories_cleared = 0;

  nlohmann::json ToJson() const;
};

class HierarchicalToolManager {
 public:
  static constexpr int kDefaultMaxConcurrent = 8;

  HierarchicalToolManager() = default;
  HierarchicalToolManager(const HierarchicalToolManager&) = delete;
  HierarchicalToolManager& operator=(const HierarchicalToolManager&) = delete;

  // Category sources survive GracefulShutdown; the materialized categories
  // built from them do not. Loaders fill the table they are handed and must
  // not call back into the manager.
  void RegisterCategory(const std::string& name, const std::string& description, CategoryLoader loader = {});
  void RegisterTool(const std::string& category, ToolSchema schema, ToolHandler handler);

  void DiscoverCategories();

  std::vector<CategoryInfo> ListCategories(bool include_count = false);
  std::vector<ToolSchema> ListTools(const std::string& category);
  nlohmann::json GetToolSchema(const std::string& category, const std::string& tool);
  std::vector<ToolListing> ListAllTools();

  // First category, in name order, that holds `tool`.
  std::optional<std::string> ResolveToolCategory(const std::string& tool);

  // Throws UnknownCategoryError, UnknownToolError, ToolExecutionError or
  // ShuttingDownError.
  nlohmann::json Dispatch(const std::string& category,
                          const std::string& tool,
                          const nlohmann::json& params = nlohmann::json::object());

  // Runs `calls` in consecutive batches of `max_concurrent`; every call of a
  // batch finishes before the next batch starts. Results keep input order.
  // Failures are captured per item and never stop the run.
  std::vector<DispatchOutcome> DispatchParallel(const std::vector<DispatchCall>& calls,
                                                int max_concurrent = kDefaultMaxConcurrent);

  // Same batching, but the first batch with a failure ends the run: a single
  // failure is rethrown as-is, several become an AggregateDispatchError.
  std::vector<nlohmann::json> DispatchParallelOrThrow(const std::vector<DispatchCall>& calls,
                                                      int max_concurrent = kDefaultMaxConcurrent);

  // Clears every category within `timeout` and resets the manager to its
  // freshly constructed state. Never throws.
  ShutdownReport GracefulShutdown(std::chrono::milliseconds timeout);

  bool categories_discovered() const;
  bool shutting_down() const { return shutting_down_.load(); }
  std::size_t category_count() const;

 private:
  struct CategorySource {
    std::string description;
    std::vector<ToolEntry> tools;
    CategoryLoader loader;
  };

  struct BatchSlot {
    nlohmann::json value;
    std::exception_ptr error;
  };

  void EnsureCategoriesDiscovered();
  std::shared_ptr<ToolCategory> FindCategory(const std::string& name);
  std::shared_ptr<ToolCategory> MaterializeLocked(const std::string& name, const CategorySource& source);
  std::vector<std::shared_ptr<ToolCategory>> SnapshotCategories();
  std::vector<BatchSlot> RunBatch(const std::vector<DispatchCall>& calls, std::size_t begin, std::size_t end);

  mutable std::shared_mutex mu_;
  std::map<std::string, CategorySource> sources_;
  std::map<std::string, std::shared_ptr<ToolCategory>> categories_;
  bool discovered_categories_ = false;

  std::mutex shutdown_mu_;
  std::atomic<bool> shutting_down_{false};
};

}  // namespace toolmesh
