#pragma once

#include "tool_manager.hpp"

#include <string>

namespace toolmesh {

inline constexpr const char* kMetaCategory = "meta";
inline constexpr const char* kSystemCategory = "system";

// Hierarchy navigation and batch dispatch, exposed as ordinary tools so a
// remote peer can reach them through tools/call. `max_concurrent` is both the
// default batch width of dispatch_parallel and its upper bound.
void RegisterMetaTools(HierarchicalToolManager* manager, int max_concurrent);

void RegisterSystemTools(HierarchicalToolManager* manager, const std::string& peer_id);

}  // namespace toolmesh
