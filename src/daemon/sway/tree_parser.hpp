#pragma once

#include "errors.hpp"
#include "window_record.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// GET_TREE reply -> every leaf window, including the ones parked in the scratchpad.
std::expected<std::vector<WindowRecord>, Error> parse_tree(const std::string& payload);

// GET_WORKSPACES reply.
std::expected<std::vector<WorkspaceInfo>, Error> parse_workspaces(const std::string& payload);

// GET_OUTPUTS reply.
std::expected<std::vector<OutputInfo>, Error> parse_outputs(const std::string& payload);

// RUN_COMMAND reply: an array of {"success": bool, "error": "..."}.
std::expected<void, Error> check_command_reply(const std::string& payload);

Rect rect_from_json(const nlohmann::json& j);
