#include "tool_category.hpp"

#include "dispatch_errors.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace toolmesh {

void ToolTable::Add(ToolSchema schema, ToolHandler handler) {
  entries_.push_back(ToolEntry{std::move(schema), std::move(handler)});
}

ToolCategory::ToolCategory(std::string name,
                           std::string description,
                           std::vector<ToolEntry> static_tools,
                           CategoryLoader loader)
    : name_(std::move(name)),
      description_(std::move(description)),
      loader_(std::move(loader)),
      seed_tools_(std::move(static_tools)) {}

bool ToolCategory::discovered() const {
  std::lock_guard<std::mutex> lock(mu_);
  return discovered_;
}

void ToolCategory::DiscoverTools() {
  std::lock_guard<std::mutex> lock(mu_);
  DiscoverToolsLocked();
}

void ToolCategory::DiscoverToolsLocked() {
  if (discovered_ || retired_) return;
  for (const auto& e : seed_tools_) InsertLocked(e);
  if (loader_) {
    ToolTable table;
    try {
      loader_(&table);
    } catch (const std::exception& e) {
      // Keep whatever the loader managed to register before failing.
      std::cout << "[discovery] loader failed category=" << name_ << " error=" << e.what() << "\n";
    } catch (...) {
      std::cout << "[discovery] loader failed category=" << name_ << " error=non-standard exception\n";
    }
    for (auto& e : table.entries()) InsertLocked(std::move(e));
  }
  discovered_ = true;
  std::cout << "[discovery] category=" << name_ << " tools=" << tools_.size() << "\n";
}

void ToolCategory::InsertLocked(ToolEntry entry) {
  if (entry.schema.name.empty() || !entry.handler) return;
  auto it = index_.find(entry.schema.name);
  if (it != index_.end()) {
    schema_cache_.erase(entry.schema.name);
    tools_[it->second] = std::move(entry);
    return;
  }
  index_.emplace(entry.schema.name, tools_.size());
  tools_.push_back(std::move(entry));
}

std::vector<ToolSchema> ToolCategory::ListTools() {
  std::lock_guard<std::mutex> lock(mu_);
  DiscoverToolsLocked();
  std::vector<ToolSchema> out;
  out.reserve(tools_.size());
  for (const auto& t : tools_) out.push_back(t.schema);
  return out;
}

bool ToolCategory::HasTool(const std::string& tool) {
  std::lock_guard<std::mutex> lock(mu_);
  DiscoverToolsLocked();
  return index_.count(tool) > 0;
}

std::size_t ToolCategory::ToolCount() {
  std::lock_guard<std::mutex> lock(mu_);
  DiscoverToolsLocked();
  return tools_.size();
}

std::optional<ToolHandler> ToolCategory::GetHandler(const std::string& tool) {
  std::lock_guard<std::mutex> lock(mu_);
  DiscoverToolsLocked();
  auto it = index_.find(tool);
  if (it == index_.end()) return std::nullopt;
  return tools_[it->second].handler;
}

std::optional<nlohmann::json> ToolCategory::GetToolSchema(const std::string& tool) {
  std::lock_guard<std::mutex> lock(mu_);
  DiscoverToolsLocked();
  if (auto cached = schema_cache_.find(tool); cached != schema_cache_.end()) return cached->second;
  auto it = index_.find(tool);
  if (it == index_.end()) return std::nullopt;
  const auto& s = tools_[it->second].schema;
  nlohmann::json j;
  j["name"] = s.name;
  j["category"] = name_;
  j["description"] = s.description;
  j["input_schema"] = s.input_schema.is_null() ? nlohmann::json{{"type", "object"}} : s.input_schema;
  schema_cache_[tool] = j;
  return j;
}

nlohmann::json ToolCategory::Invoke(const std::string& tool, const nlohmann::json& params) {
  ToolHandler handler;
  {
    std::lock_guard<std::mutex> lock(mu_);
    DiscoverToolsLocked();
    auto it = index_.find(tool);
    if (it == index_.end()) throw UnknownToolError(name_, tool);
    handler = tools_[it->second].handler;
    active_calls_++;
  }

  struct ActiveCallGuard {
    ToolCategory* self;
    ~ActiveCallGuard() {
      std::lock_guard<std::mutex> lock(self->mu_);
      self->active_calls_--;
      self->idle_cv_.notify_all();
    }
  } guard{this};

  try {
    return handler(params.is_null() ? nlohmann::json::object() : params);
  } catch (const DispatchError&) {
    throw;
  } catch (const std::exception& e) {
    throw ToolExecutionError(e.what());
  } catch (...) {
    throw ToolExecutionError("tool raised a non-standard exception");
  }
}

void ToolCategory::AddTool(const ToolEntry& entry) {
  std::lock_guard<std::mutex> lock(mu_);
  if (retired_) return;
  seed_tools_.push_back(entry);
  if (discovered_) InsertLocked(entry);
}

bool ToolCategory::Clear(std::chrono::steady_clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(mu_);
  if (!idle_cv_.wait_until(lock, deadline, [this] { return active_calls_ == 0; })) return false;
  seed_tools_.clear();
  tools_.clear();
  index_.clear();
  schema_cache_.clear();
  discovered_ = false;
  retired_ = true;
  return true;
}

int ToolCategory::active_calls() const {
  std::lock_guard<std::mutex> lock(mu_);
  return active_calls_;
}

}  // namespace toolmesh
