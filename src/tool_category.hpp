#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolmesh {

struct ToolSchema {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
};

using ToolHandler = std::function<nlohmann::json(const nlohmann::json& params)>;

struct ToolEntry {
  ToolSchema schema;
  ToolHandler handler;
};

// Sink a category loader fills during tool discovery.
class ToolTable {
 public:
  void Add(ToolSchema schema, ToolHandler handler);
  std::vector<ToolEntry>& entries() { return entries_; }

 private:
  std::vector<ToolEntry> entries_;
};

using CategoryLoader = std::function<void(ToolTable* table)>;

// One category of the two-level tool table. Tools are stored in insertion
// order with a name index; both are populated by a single discovery step that
// runs under the category lock, so concurrent readers see either the empty
// pre-discovery table or the complete one.
class ToolCategory {
 public:
  ToolCategory(std::string name, std::string description, std::vector<ToolEntry> static_tools, CategoryLoader loader);
  ToolCategory(const ToolCategory&) = delete;
  ToolCategory& operator=(const ToolCategory&) = delete;

  const std::string& name() const { return name_; }
  const std::string& description() const { return description_; }

  bool discovered() const;
  void DiscoverTools();

  std::vector<ToolSchema> ListTools();
  bool HasTool(const std::string& tool);
  std::size_t ToolCount();
  std::optional<ToolHandler> GetHandler(const std::string& tool);

  // Full schema {name, category, description, input_schema}, built once and
  // then served from the schema cache.
  std::optional<nlohmann::json> GetToolSchema(const std::string& tool);

  // Throws UnknownToolError, or ToolExecutionError wrapping whatever the
  // handler threw.
  nlohmann::json Invoke(const std::string& tool, const nlohmann::json& params);

  // Registers a tool with the category source; it becomes visible right away
  // if the table is already discovered, otherwise at discovery.
  void AddTool(const ToolEntry& entry);

  // Waits for in-flight calls to finish, then drops tools, schema cache and
  // the discovered flag and retires the category so it never rediscovers.
  // Returns false if the deadline passes first; the category is left
  // untouched in that case.
  bool Clear(std::chrono::steady_clock::time_point deadline);

  int active_calls() const;

 private:
  void DiscoverToolsLocked();
  void InsertLocked(ToolEntry entry);

  const std::string name_;
  const std::string description_;
  const CategoryLoader loader_;

  mutable std::mutex mu_;
  std::condition_variable idle_cv_;
  std::vector<ToolEntry> seed_tools_;
  std::vector<ToolEntry> tools_;
  std::unordered_map<std::string, std::size_t> index_;
  std::unordered_map<std::string, nlohmann::json> schema_cache_;
  bool discovered_ = false;
  bool retired_ = false;
  int active_calls_ = 0;
};

}  // namespace toolmesh
