#include "tool_manager.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <utility>

namespace toolmesh {
namespace {

static DispatchFailure FailureFromException(std::exception_ptr ep, std::size_t index) {
  DispatchFailure f;
  f.index = index;
  try {
    std::rethrow_exception(ep);
  } catch (const DispatchError& e) {
    f.kind = e.kind();
    f.message = e.what();
  } catch (const std::exception& e) {
    f.kind = DispatchErrorKind::kToolFailed;
    f.message = e.what();
  } catch (...) {
    f.kind = DispatchErrorKind::kToolFailed;
    f.message = "unknown exception";
  }
  return f;
}

static const char* ShutdownStatusName(ShutdownStatus s) {
  return s == ShutdownStatus::kOk ? "ok" : "timeout";
}

}  // namespace

nlohmann::json OutcomeToJson(const DispatchOutcome& outcome) {
  if (outcome) return *outcome;
  return {{"status", "error"}, {"error", outcome.error().message}};
}

nlohmann::json ShutdownReport::ToJson() const {
  return {{"status", ShutdownStatusName(status)}, {"categories_cleared", categories_cleared}};
}

void HierarchicalToolManager::RegisterCategory(const std::string& name,
                                               const std::string& description,
                                               CategoryLoader loader) {
  if (name.empty()) return;
  std::unique_lock lock(mu_);
  auto& source = sources_[name];
  source.description = description;
  source.loader = std::move(loader);
  if (discovered_categories_ && !categories_.count(name)) MaterializeLocked(name, source);
}

void HierarchicalToolManager::RegisterTool(const std::string& category, ToolSchema schema, ToolHandler handler) {
  if (category.empty() || schema.name.empty() || !handler) return;
  ToolEntry entry{std::move(schema), std::move(handler)};
  std::unique_lock lock(mu_);
  auto& source = sources_[category];
  source.tools.push_back(entry);
  if (!discovered_categories_) return;
  auto it = categories_.find(category);
  if (it == categories_.end()) {
    MaterializeLocked(category, source);
  } else {
    it->second->AddTool(entry);
  }
}

std::shared_ptr<ToolCategory> HierarchicalToolManager::MaterializeLocked(const std::string& name,
                                                                         const CategorySource& source) {
  auto category = std::make_shared<ToolCategory>(name, source.description, source.tools, source.loader);
  categories_[name] = category;
  return category;
}

void HierarchicalToolManager::DiscoverCategories() {
  std::unique_lock lock(mu_);
  for (const auto& [name, source] : sources_) {
    if (!categories_.count(name)) MaterializeLocked(name, source);
  }
  discovered_categories_ = true;
}

void HierarchicalToolManager::EnsureCategoriesDiscovered() {
  {
    std::shared_lock lock(mu_);
    if (discovered_categories_) return;
  }
  DiscoverCategories();
}

std::shared_ptr<ToolCategory> HierarchicalToolManager::FindCategory(const std::string& name) {
  EnsureCategoriesDiscovered();
  std::shared_lock lock(mu_);
  auto it = categories_.find(name);
  if (it == categories_.end()) return nullptr;
  return it->second;
}

std::vector<std::shared_ptr<ToolCategory>> HierarchicalToolManager::SnapshotCategories() {
  EnsureCategoriesDiscovered();
  std::shared_lock lock(mu_);
  std::vector<std::shared_ptr<ToolCategory>> out;
  out.reserve(categories_.size());
  for (const auto& [_, c] : categories_) out.push_back(c);
  return out;
}

std::vector<CategoryInfo> HierarchicalToolManager::ListCategories(bool include_count) {
  std::vector<CategoryInfo> out;
  for (const auto& c : SnapshotCategories()) {
    CategoryInfo info;
    info.name = c->name();
    info.description = c->description();
    if (include_count) info.tool_count = c->ToolCount();
    out.push_back(std::move(info));
  }
  return out;
}

std::vector<ToolSchema> HierarchicalToolManager::ListTools(const std::string& category) {
  auto c = FindCategory(category);
  if (!c) throw UnknownCategoryError(category);
  return c->ListTools();
}

nlohmann::json HierarchicalToolManager::GetToolSchema(const std::string& category, const std::string& tool) {
  auto c = FindCategory(category);
  if (!c) throw UnknownCategoryError(category);
  auto schema = c->GetToolSchema(tool);
  if (!schema) throw UnknownToolError(category, tool);
  return *schema;
}

std::vector<ToolListing> HierarchicalToolManager::ListAllTools() {
  std::vector<ToolListing> out;
  for (const auto& c : SnapshotCategories()) {
    auto tools = c->ListTools();
    std::sort(tools.begin(), tools.end(), [](const ToolSchema& a, const ToolSchema& b) { return a.name < b.name; });
    for (auto& t : tools) out.push_back(ToolListing{c->name(), std::move(t)});
  }
  return out;
}

std::optional<std::string> HierarchicalToolManager::ResolveToolCategory(const std::string& tool) {
  for (const auto& c : SnapshotCategories()) {
    if (c->HasTool(tool)) return c->name();
  }
  return std::nullopt;
}

nlohmann::json HierarchicalToolManager::Dispatch(const std::string& category,
                                                 const std::string& tool,
                                                 const nlohmann::json& params) {
  if (shutting_down_.load()) throw ShuttingDownError();
  auto c = FindCategory(category);
  if (!c) throw UnknownCategoryError(category);
  return c->Invoke(tool, params);
}

std::vector<HierarchicalToolManager::BatchSlot> HierarchicalToolManager::RunBatch(const std::vector<DispatchCall>& calls,
                                                                                  std::size_t begin,
                                                                                  std::size_t end) {
  std::vector<std::future<nlohmann::json>> pending;
  pending.reserve(end - begin);
  for (std::size_t i = begin; i < end; i++) {
    const DispatchCall& call = calls[i];
    pending.push_back(std::async(std::launch::async, [this, &call]() {
      return Dispatch(call.category, call.tool, call.params);
    }));
  }

  std::vector<BatchSlot> slots(pending.size());
  for (std::size_t k = 0; k < pending.size(); k++) {
    try {
      slots[k].value = pending[k].get();
    } catch (...) {
      slots[k].error = std::current_exception();
    }
  }
  return slots;
}

std::vector<DispatchOutcome> HierarchicalToolManager::DispatchParallel(const std::vector<DispatchCall>& calls,
                                                                       int max_concurrent) {
  const std::size_t batch = static_cast<std::size_t>(std::max(1, max_concurrent));
  std::vector<DispatchOutcome> out;
  out.reserve(calls.size());
  for (std::size_t begin = 0; begin < calls.size(); begin += batch) {
    const std::size_t end = std::min(calls.size(), begin + batch);
    auto slots = RunBatch(calls, begin, end);
    for (std::size_t k = 0; k < slots.size(); k++) {
      if (slots[k].error) {
        auto failure = FailureFromException(slots[k].error, begin + k);
        std::cout << "[dispatch] error index=" << failure.index << " category=" << calls[begin + k].category
                  << " tool=" << calls[begin + k].tool << " error=" << failure.message << "\n";
        out.emplace_back(std::unexpected(std::move(failure)));
      } else {
        out.emplace_back(std::move(slots[k].value));
      }
    }
  }
  return out;
}

std::vector<nlohmann::json> HierarchicalToolManager::DispatchParallelOrThrow(const std::vector<DispatchCall>& calls,
                                                                             int max_concurrent) {
  const std::size_t batch = static_cast<std::size_t>(std::max(1, max_concurrent));
  std::vector<nlohmann::json> out;
  out.reserve(calls.size());
  for (std::size_t begin = 0; begin < calls.size(); begin += batch) {
    const std::size_t end = std::min(calls.size(), begin + batch);
    auto slots = RunBatch(calls, begin, end);

    std::vector<DispatchFailure> failures;
    std::exception_ptr first;
    for (std::size_t k = 0; k < slots.size(); k++) {
      if (!slots[k].error) {
        out.push_back(std::move(slots[k].value));
        continue;
      }
      if (!first) first = slots[k].error;
      failures.push_back(FailureFromException(slots[k].error, begin + k));
    }
    if (failures.size() == 1) std::rethrow_exception(first);
    if (failures.size() > 1) throw AggregateDispatchError(std::move(failures));
  }
  return out;
}

ShutdownReport HierarchicalToolManager::GracefulShutdown(std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> serial(shutdown_mu_);
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  shutting_down_.store(true);

  std::vector<std::shared_ptr<ToolCategory>> snapshot;
  {
    std::shared_lock lock(mu_);
    for (const auto& [_, c] : categories_) snapshot.push_back(c);
  }

  ShutdownReport report;
  std::vector<std::string> cleared;
  for (const auto& c : snapshot) {
    if (!c->Clear(deadline)) {
      report.status = ShutdownStatus::kTimeout;
      std::cout << "[shutdown] deadline passed category=" << c->name() << " active_calls=" << c->active_calls()
                << "\n";
      break;
    }
    cleared.push_back(c->name());
  }

  {
    std::unique_lock lock(mu_);
    for (const auto& name : cleared) categories_.erase(name);
    if (categories_.empty()) discovered_categories_ = false;
  }
  report.categories_cleared = cleared.size();
  shutting_down_.store(false);

  std::cout << "[shutdown] status=" << ShutdownStatusName(report.status)
            << " categories_cleared=" << report.categories_cleared << "\n";
  return report;
}

bool HierarchicalToolManager::categories_discovered() const {
  std::shared_lock lock(mu_);
  return discovered_categories_;
}

std::size_t HierarchicalToolManager::category_count() const {
  std::shared_lock lock(mu_);
  return categories_.size();
}

}  // namespace toolmesh
