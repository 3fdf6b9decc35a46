#include "tools/builtin_tools.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace toolmesh {
namespace {

static std::string RequireString(const nlohmann::json& arguments, const char* key) {
  if (!arguments.is_object() || !arguments.contains(key) || !arguments[key].is_string()) {
    throw std::invalid_argument(std::string("missing required field: ") + key);
  }
  auto v = arguments[key].get<std::string>();
  if (v.empty()) throw std::invalid_argument(std::string("empty field: ") + key);
  return v;
}

static bool GetBool(const nlohmann::json& arguments, const char* key, bool fallback) {
  if (arguments.is_object() && arguments.contains(key) && arguments[key].is_boolean()) return arguments[key].get<bool>();
  return fallback;
}

static nlohmann::json GetObject(const nlohmann::json& arguments, const char* key) {
  if (arguments.is_object() && arguments.contains(key) && arguments[key].is_object()) return arguments[key];
  return nlohmann::json::object();
}

// A caller may lower the batch width but never raise it past the configured cap.
static int BatchWidth(const nlohmann::json& arguments, int cap) {
  cap = std::max(cap, 1);
  if (!arguments.is_object() || !arguments.contains("max_concurrent") || !arguments["max_concurrent"].is_number_integer()) {
    return cap;
  }
  const auto requested = arguments["max_concurrent"].get<long long>();
  return static_cast<int>(std::clamp<long long>(requested, 1, cap));
}

static std::vector<DispatchCall> ParseCalls(const nlohmann::json& arguments) {
  if (!arguments.is_object() || !arguments.contains("calls") || !arguments["calls"].is_array()) {
    throw std::invalid_argument("missing required field: calls");
  }
  std::vector<DispatchCall> calls;
  for (const auto& c : arguments["calls"]) {
    DispatchCall call;
    call.category = RequireString(c, "category");
    call.tool = RequireString(c, "tool");
    call.params = GetObject(c, "params");
    calls.push_back(std::move(call));
  }
  return calls;
}

}  // namespace

void RegisterMetaTools(HierarchicalToolManager* manager, int max_concurrent) {
  manager->RegisterCategory(kMetaCategory, "Navigate the tool hierarchy and dispatch calls in batches.");

  {
    ToolSchema schema;
    schema.name = "list_categories";
    schema.description = "List tool categories in name order.";
    schema.input_schema = {{"type", "object"}, {"properties", {{"include_count", {{"type", "boolean"}}}}}};
    manager->RegisterTool(kMetaCategory, schema, [manager](const nlohmann::json& arguments) {
      nlohmann::json out = nlohmann::json::array();
      for (const auto& c : manager->ListCategories(GetBool(arguments, "include_count", false))) {
        nlohmann::json j = {{"name", c.name}, {"description", c.description}};
        if (c.tool_count) j["tool_count"] = *c.tool_count;
        out.push_back(std::move(j));
      }
      return nlohmann::json{{"categories", std::move(out)}};
    });
  }

  {
    ToolSchema schema;
    schema.name = "list_tools";
    schema.description = "List the tools of one category.";
    schema.input_schema = {{"type", "object"},
                           {"properties", {{"category", {{"type", "string"}}}}},
                           {"required", {"category"}}};
    manager->RegisterTool(kMetaCategory, schema, [manager](const nlohmann::json& arguments) {
      const auto category = RequireString(arguments, "category");
      nlohmann::json tools = nlohmann::json::array();
      for (const auto& t : manager->ListTools(category)) {
        tools.push_back({{"name", t.name}, {"description", t.description}});
      }
      return nlohmann::json{{"category", category}, {"tools", std::move(tools)}};
    });
  }

  {
    ToolSchema schema;
    schema.name = "get_schema";
    schema.description = "Full schema of one tool.";
    schema.input_schema = {{"type", "object"},
                           {"properties", {{"category", {{"type", "string"}}}, {"tool", {{"type", "string"}}}}},
                           {"required", {"category", "tool"}}};
    manager->RegisterTool(kMetaCategory, schema, [manager](const nlohmann::json& arguments) {
      return manager->GetToolSchema(RequireString(arguments, "category"), RequireString(arguments, "tool"));
    });
  }

  {
    ToolSchema schema;
    schema.name = "dispatch";
    schema.description = "Invoke a tool by category and name.";
    schema.input_schema = {{"type", "object"},
                           {"properties",
                            {{"category", {{"type", "string"}}},
                             {"tool", {{"type", "string"}}},
                             {"params", {{"type", "object"}}}}},
                           {"required", {"category", "tool"}}};
    manager->RegisterTool(kMetaCategory, schema, [manager](const nlohmann::json& arguments) {
      return manager->Dispatch(
          RequireString(arguments, "category"), RequireString(arguments, "tool"), GetObject(arguments, "params"));
    });
  }

  {
    ToolSchema schema;
    schema.name = "dispatch_parallel";
    schema.description =
        "Run several calls in batches of max_concurrent. With return_exceptions (default true) failed calls come back "
        "as {status: \"error\", error} in their slot; otherwise the first failing batch fails the whole call.";
    schema.input_schema = {
        {"type", "object"},
        {"properties",
         {{"calls",
           {{"type", "array"},
            {"items",
             {{"type", "object"},
              {"properties",
               {{"category", {{"type", "string"}}}, {"tool", {{"type", "string"}}}, {"params", {{"type", "object"}}}}},
              {"required", {"category", "tool"}}}}}},
          {"max_concurrent", {{"type", "integer"}, {"minimum", 1}, {"maximum", std::max(max_concurrent, 1)}}},
          {"return_exceptions", {{"type", "boolean"}}}}},
        {"required", {"calls"}}};
    manager->RegisterTool(kMetaCategory, schema, [manager, max_concurrent](const nlohmann::json& arguments) {
      const auto calls = ParseCalls(arguments);
      const int width = BatchWidth(arguments, max_concurrent);

      nlohmann::json results = nlohmann::json::array();
      if (GetBool(arguments, "return_exceptions", true)) {
        for (const auto& outcome : manager->DispatchParallel(calls, width)) {
          results.push_back(OutcomeToJson(outcome));
        }
      } else {
        for (auto& r : manager->DispatchParallelOrThrow(calls, width)) results.push_back(std::move(r));
      }
      return nlohmann::json{{"results", std::move(results)}};
    });
  }
}

void RegisterSystemTools(HierarchicalToolManager* manager, const std::string& peer_id) {
  manager->RegisterCategory(kSystemCategory, "Liveness and diagnostics.");

  {
    ToolSchema schema;
    schema.name = "echo";
    schema.description = "Return the arguments unchanged.";
    schema.input_schema = {{"type", "object"}};
    manager->RegisterTool(kSystemCategory, schema, [](const nlohmann::json& arguments) { return arguments; });
  }

  {
    ToolSchema schema;
    schema.name = "ping";
    schema.description = "Liveness probe.";
    schema.input_schema = {{"type", "object"}, {"properties", nlohmann::json::object()}};
    manager->RegisterTool(kSystemCategory, schema, [peer_id](const nlohmann::json&) {
      return nlohmann::json{{"ok", true}, {"peer_id", peer_id}};
    });
  }
}

}  // namespace toolmesh
