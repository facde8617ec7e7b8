#include "wm_event.hpp"

#include "ipc_protocol.hpp"

#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::expected<WmEvent, Error> parse_event(uint32_t type, const std::string& payload) {
    WmEvent ev;
    switch (type) {
        case ipc_msg::EVENT_WINDOW: ev.kind = WmEventKind::Window; break;
        case ipc_msg::EVENT_WORKSPACE: ev.kind = WmEventKind::Workspace; break;
        case ipc_msg::EVENT_OUTPUT: ev.kind = WmEventKind::Output; break;
        case ipc_msg::EVENT_SHUTDOWN: ev.kind = WmEventKind::Shutdown; break;
        default:
            return std::unexpected(Error{ErrorKind::Protocol, std::format("unexpected event type {:#x}", type)});
    }

    try {
        auto j = json::parse(payload);
        if (!j.is_object()) {
            return std::unexpected(Error{ErrorKind::Protocol, "event payload is not an object"});
        }
        ev.change = j.value("change", "");
        if (ev.kind == WmEventKind::Window) {
            if (!j.contains("container") || !j["container"].is_object()) {
                return std::unexpected(Error{ErrorKind::Protocol, "window event without container"});
            }
            ev.container_id = j["container"].value("id", int64_t{0});
        }
        return ev;
    } catch (const json::exception& e) {
        return std::unexpected(Error{ErrorKind::Protocol, std::format("event parse error: {}", e.what())});
    }
}

const char* to_string(WmEventKind kind) {
    switch (kind) {
        case WmEventKind::Window: return "window";
        case WmEventKind::Workspace: return "workspace";
        case WmEventKind::Output: return "output";
        case WmEventKind::Shutdown: return "shutdown";
    }
    return "unknown";
}
