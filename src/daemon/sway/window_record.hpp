#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool operator==(const Rect&) const = default;
};

// One window as seen in a single tree query. Never cached across queries.
struct WindowRecord {
    int64_t id = 0;
    std::string window_class;  // X11 class, or app_id for native Wayland windows
    std::string instance;      // X11 instance, or app_id for native Wayland windows
    std::string title;
    int workspace_num = -1;    // -1 for the scratchpad
    std::string workspace_name;
    std::string output;
    std::vector<std::string> marks;
    bool floating = false;
    Rect rect;
    int pid = 0;

    bool in_scratchpad() const { return workspace_name == "__i3_scratch"; }
    bool empty() const { return id == 0; }
};

struct WorkspaceInfo {
    int num = -1;
    std::string name;
    std::string output;
    Rect rect;
    bool focused = false;
    bool visible = false;
};

struct OutputInfo {
    std::string name;
    bool active = false;
    Rect rect;
    std::string current_workspace;
};

struct TreeSnapshot {
    std::vector<WindowRecord> windows;
    std::vector<WorkspaceInfo> workspaces;
    std::vector<OutputInfo> outputs;

    const WindowRecord* find(int64_t id) const;
    const WorkspaceInfo* focused_workspace() const;
    const WorkspaceInfo* workspace(int num) const;
    bool has_output(const std::string& name) const;
};
