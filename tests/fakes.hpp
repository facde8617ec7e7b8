#pragma once

#include "platform/cursor_query.hpp"
#include "platform/process_detector.hpp"
#include "platform/window_manager.hpp"

#include <algorithm>
#include <cstdio>
#include <deque>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

// In-memory window manager. Applies the subset of sway commands the daemon
// issues to its own tree, so a second sweep sees the result of the first.
class FakeWindowManager : public WindowManager {
public:
    TreeSnapshot tree;
    std::vector<std::string> commands;

    bool is_connected = true;
    int connect_failures = 0;          // connect() fails this many more times
    std::optional<Error> snapshot_error;
    std::optional<Error> command_error;      // every command fails
    std::set<int64_t> failing_windows;       // commands on these fail with a Protocol error
    std::deque<std::expected<WmEvent, Error>> events;
    int snapshots = 0;

    std::expected<void, Error> connect() override {
        if (connect_failures > 0) {
            connect_failures--;
            return std::unexpected(Error{ErrorKind::TransientIo, "connection refused"});
        }
        is_connected = true;
        return {};
    }
    std::expected<void, Error> subscribe() override { return {}; }
    void disconnect() override { is_connected = false; }
    bool connected() const override { return is_connected; }

    std::expected<TreeSnapshot, Error> snapshot() override {
        snapshots++;
        if (snapshot_error) return std::unexpected(*snapshot_error);
        if (!is_connected) return std::unexpected(Error{ErrorKind::TransientIo, "not connected"});
        return tree;
    }

    std::expected<void, Error> run_command(const std::string& command) override {
        commands.push_back(command);
        if (command_error) return std::unexpected(*command_error);
        if (!is_connected) return std::unexpected(Error{ErrorKind::TransientIo, "not connected"});

        long long id = 0;
        int consumed = 0;
        if (std::sscanf(command.c_str(), "[con_id=%lld] %n", &id, &consumed) != 1 || consumed == 0) {
            return std::unexpected(Error{ErrorKind::Protocol, "unsupported command: " + command});
        }
        if (failing_windows.contains(id)) {
            return std::unexpected(Error{ErrorKind::Protocol, "command failed for window"});
        }
        auto it = std::ranges::find_if(tree.windows, [id](const WindowRecord& w) { return w.id == id; });
        if (it == tree.windows.end()) {
            return std::unexpected(Error{ErrorKind::Protocol, "no matching window"});
        }
        apply(*it, command.substr(static_cast<size_t>(consumed)));
        return {};
    }

    int event_fd() const override { return is_connected ? 42 : -1; }

    std::expected<WmEvent, Error> read_event() override {
        if (events.empty()) return std::unexpected(Error{ErrorKind::TransientIo, "no event"});
        auto e = events.front();
        events.pop_front();
        return e;
    }

    WindowRecord* window(int64_t id) {
        auto it = std::ranges::find_if(tree.windows, [id](const WindowRecord& w) { return w.id == id; });
        return it != tree.windows.end() ? &*it : nullptr;
    }

    // Commands issued since the last call.
    std::vector<std::string> take_commands() {
        auto out = std::move(commands);
        commands.clear();
        return out;
    }

private:
    static std::string unquote(const std::string& s) {
        if (s.size() < 2 || s.front() != '"' || s.back() != '"') return s;
        std::string out;
        for (size_t i = 1; i + 1 < s.size(); ++i) {
            if (s[i] == '\\' && i + 2 < s.size()) ++i;
            out += s[i];
        }
        return out;
    }

    void apply(WindowRecord& w, const std::string& cmd) {
        auto rest = [&](const std::string& prefix) { return cmd.substr(prefix.size()); };

        if (cmd.starts_with("mark --add ")) {
            auto mark = unquote(rest("mark --add "));
            // Marks are unique across the whole tree.
            for (auto& other : tree.windows) std::erase(other.marks, mark);
            w.marks.push_back(mark);
        } else if (cmd.starts_with("unmark ")) {
            std::erase(w.marks, unquote(rest("unmark ")));
        } else if (cmd == "move scratchpad") {
            w.workspace_name = "__i3_scratch";
            w.workspace_num = -1;
            w.output = "__i3";
            w.floating = true;
        } else if (cmd == "scratchpad show") {
            const auto* ws = tree.focused_workspace();
            w.workspace_name = ws ? ws->name : "1";
            w.workspace_num = ws ? ws->num : 1;
            w.output = ws ? ws->output : "";
            w.floating = true;
        } else if (cmd.starts_with("move container to workspace number ")) {
            w.workspace_num = std::stoi(rest("move container to workspace number "));
            w.workspace_name = std::to_string(w.workspace_num);
            if (const auto* ws = tree.workspace(w.workspace_num)) w.output = ws->output;
        } else if (cmd == "floating disable") {
            w.floating = false;
        } else if (cmd == "floating enable") {
            w.floating = true;
        } else if (cmd.starts_with("resize set ")) {
            std::sscanf(cmd.c_str(), "resize set %d %d", &w.rect.width, &w.rect.height);
        } else if (cmd.starts_with("move absolute position ")) {
            std::sscanf(cmd.c_str(), "move absolute position %d %d", &w.rect.x, &w.rect.y);
        }
    }
};

class FakeCursorQuery : public CursorQuery {
public:
    std::deque<std::expected<PointerLocation, Error>> responses;
    std::expected<PointerLocation, Error> fallback =
        std::unexpected(Error{ErrorKind::Timeout, "no pointer"});
    bool throw_next = false;
    int calls = 0;

    std::expected<PointerLocation, Error> query(std::chrono::milliseconds) override {
        calls++;
        if (throw_next) {
            throw_next = false;
            throw std::runtime_error("pointer backend crashed");
        }
        if (responses.empty()) return fallback;
        auto r = responses.front();
        responses.pop_front();
        return r;
    }
};

class FakeDetector : public ProcessDetector {
public:
    std::map<int, std::string> projects;

    std::optional<std::string> project_for_pid(int pid) const override {
        auto it = projects.find(pid);
        if (it == projects.end()) return std::nullopt;
        return it->second;
    }
};

// One 1920x1080 output with workspace 1 focused.
inline TreeSnapshot single_output_tree() {
    TreeSnapshot t;
    t.outputs.push_back(OutputInfo{.name = "HEADLESS-1", .active = true,
                                   .rect = {0, 0, 1920, 1080}, .current_workspace = "1"});
    t.workspaces.push_back(WorkspaceInfo{.num = 1, .name = "1", .output = "HEADLESS-1",
                                         .rect = {0, 0, 1920, 1080}, .focused = true, .visible = true});
    return t;
}

inline WindowRecord make_window(int64_t id, const std::string& cls, int pid = 0) {
    WindowRecord w;
    w.id = id;
    w.window_class = cls;
    w.instance = cls;
    w.title = cls + " window";
    w.workspace_num = 1;
    w.workspace_name = "1";
    w.output = "HEADLESS-1";
    w.rect = {100, 200, 800, 600};
    w.pid = pid;
    return w;
}
