#pragma once

#include "errors.hpp"

#include <expected>
#include <string>
#include <string_view>

// The one active project. Owned by the daemon core and passed by value into
// every sweep; an empty name means no project is active.
struct ProjectContext {
    std::string name;

    bool active() const { return !name.empty(); }
    bool operator==(const ProjectContext&) const = default;
};

// Project keys end up inside marks, so they may not contain the mark
// separators. Letters, digits, '_', '-' and '.', at most 64 characters.
bool valid_project_key(std::string_view name);

// {"name": "..."}. A missing file is no active project; an unreadable or
// invalid one is a Configuration error.
std::expected<ProjectContext, Error> load_active_project(const std::string& path);

// Written to a temporary file and renamed over `path`.
std::expected<void, Error> save_active_project(const std::string& path, const ProjectContext& ctx);
