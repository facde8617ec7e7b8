#include "window_record.hpp"

#include <algorithm>

const WindowRecord* TreeSnapshot::find(int64_t id) const {
    auto it = std::ranges::find_if(windows, [id](const WindowRecord& w) { return w.id == id; });
    return it != windows.end() ? &*it : nullptr;
}

const WorkspaceInfo* TreeSnapshot::focused_workspace() const {
    auto it = std::ranges::find_if(workspaces, [](const WorkspaceInfo& ws) { return ws.focused; });
    if (it != workspaces.end()) return &*it;
    // No focused workspace reported (e.g. focus on an empty output): take the first visible one.
    it = std::ranges::find_if(workspaces, [](const WorkspaceInfo& ws) { return ws.visible; });
    return it != workspaces.end() ? &*it : nullptr;
}

const WorkspaceInfo* TreeSnapshot::workspace(int num) const {
    auto it = std::ranges::find_if(workspaces, [num](const WorkspaceInfo& ws) { return ws.num == num; });
    return it != workspaces.end() ? &*it : nullptr;
}

bool TreeSnapshot::has_output(const std::string& name) const {
    return std::ranges::any_of(outputs, [&](const OutputInfo& o) { return o.active && o.name == name; });
}
