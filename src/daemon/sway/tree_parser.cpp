#include "tree_parser.hpp"

#include <format>

using json = nlohmann::json;

namespace {

struct WalkContext {
    int workspace_num = -1;
    std::string workspace_name;
    std::string output;
};

std::string string_or_empty(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

bool is_leaf_window(const json& node) {
    bool no_children = (!node.contains("nodes") || node["nodes"].empty()) &&
                       (!node.contains("floating_nodes") || node["floating_nodes"].empty());
    if (!no_children) return false;

    auto type = string_or_empty(node, "type");
    if (type != "con" && type != "floating_con") return false;

    // Sway: native windows carry app_id, XWayland/i3 windows carry a window id.
    bool has_app_id = node.contains("app_id") && node["app_id"].is_string();
    bool has_x_window = node.contains("window") && node["window"].is_number();
    return has_app_id || has_x_window;
}

WindowRecord window_from_node(const json& node, const WalkContext& ctx, bool floating) {
    WindowRecord w;
    w.id = node.value("id", int64_t{0});
    w.title = string_or_empty(node, "name");
    w.pid = node.value("pid", 0);
    w.rect = rect_from_json(node.value("rect", json::object()));
    w.workspace_num = ctx.workspace_num;
    w.workspace_name = ctx.workspace_name;
    w.output = ctx.output;

    // i3 reports floating as "user_on"/"auto_on", sway as the floating_con type.
    auto i3_floating = string_or_empty(node, "floating");
    w.floating = floating || string_or_empty(node, "type") == "floating_con" ||
                 i3_floating == "user_on" || i3_floating == "auto_on";

    auto app_id = string_or_empty(node, "app_id");
    if (node.contains("window_properties") && node["window_properties"].is_object()) {
        const auto& props = node["window_properties"];
        w.window_class = string_or_empty(props, "class");
        w.instance = string_or_empty(props, "instance");
    }
    if (w.window_class.empty()) w.window_class = app_id;
    if (w.instance.empty()) w.instance = app_id;

    if (node.contains("marks") && node["marks"].is_array()) {
        for (const auto& m : node["marks"]) {
            if (m.is_string()) w.marks.push_back(m.get<std::string>());
        }
    }
    return w;
}

void walk(const json& node, WalkContext ctx, bool floating, std::vector<WindowRecord>& out) {
    auto type = string_or_empty(node, "type");
    if (type == "output") {
        ctx.output = string_or_empty(node, "name");
    } else if (type == "workspace") {
        ctx.workspace_name = string_or_empty(node, "name");
        ctx.workspace_num = node.value("num", -1);
    }

    if (is_leaf_window(node)) {
        out.push_back(window_from_node(node, ctx, floating));
        return;
    }

    if (node.contains("nodes")) {
        for (const auto& child : node["nodes"]) walk(child, ctx, floating, out);
    }
    if (node.contains("floating_nodes")) {
        for (const auto& child : node["floating_nodes"]) walk(child, ctx, true, out);
    }
}

} // namespace

Rect rect_from_json(const json& j) {
    if (!j.is_object()) return {};
    return Rect{
        .x = j.value("x", 0),
        .y = j.value("y", 0),
        .width = j.value("width", 0),
        .height = j.value("height", 0),
    };
}

std::expected<std::vector<WindowRecord>, Error> parse_tree(const std::string& payload) {
    try {
        auto tree = json::parse(payload);
        if (!tree.is_object()) {
            return std::unexpected(Error{ErrorKind::Protocol, "tree reply is not an object"});
        }
        std::vector<WindowRecord> windows;
        walk(tree, {}, false, windows);
        return windows;
    } catch (const json::exception& e) {
        return std::unexpected(Error{ErrorKind::Protocol, std::format("tree parse error: {}", e.what())});
    }
}

std::expected<std::vector<WorkspaceInfo>, Error> parse_workspaces(const std::string& payload) {
    try {
        auto j = json::parse(payload);
        if (!j.is_array()) {
            return std::unexpected(Error{ErrorKind::Protocol, "workspaces reply is not an array"});
        }
        std::vector<WorkspaceInfo> out;
        for (const auto& ws : j) {
            out.push_back(WorkspaceInfo{
                .num = ws.value("num", -1),
                .name = string_or_empty(ws, "name"),
                .output = string_or_empty(ws, "output"),
                .rect = rect_from_json(ws.value("rect", json::object())),
                .focused = ws.value("focused", false),
                .visible = ws.value("visible", false),
            });
        }
        return out;
    } catch (const json::exception& e) {
        return std::unexpected(Error{ErrorKind::Protocol, std::format("workspaces parse error: {}", e.what())});
    }
}

std::expected<std::vector<OutputInfo>, Error> parse_outputs(const std::string& payload) {
    try {
        auto j = json::parse(payload);
        if (!j.is_array()) {
            return std::unexpected(Error{ErrorKind::Protocol, "outputs reply is not an array"});
        }
        std::vector<OutputInfo> out;
        for (const auto& o : j) {
            out.push_back(OutputInfo{
                .name = string_or_empty(o, "name"),
                .active = o.value("active", false),
                .rect = rect_from_json(o.value("rect", json::object())),
                .current_workspace = string_or_empty(o, "current_workspace"),
            });
        }
        return out;
    } catch (const json::exception& e) {
        return std::unexpected(Error{ErrorKind::Protocol, std::format("outputs parse error: {}", e.what())});
    }
}

std::expected<void, Error> check_command_reply(const std::string& payload) {
    try {
        auto j = json::parse(payload);
        if (!j.is_array()) {
            return std::unexpected(Error{ErrorKind::Protocol, "command reply is not an array"});
        }
        for (const auto& r : j) {
            if (!r.value("success", false)) {
                return std::unexpected(Error{ErrorKind::Protocol,
                                             std::format("command failed: {}", string_or_empty(r, "error"))});
            }
        }
        return {};
    } catch (const json::exception& e) {
        return std::unexpected(Error{ErrorKind::Protocol, std::format("command reply parse error: {}", e.what())});
    }
}
