#include "project_context.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

bool valid_project_key(std::string_view name) {
    if (name.empty() || name.size() > 64) return false;
    for (char c : name) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '_' || c == '-' || c == '.';
        if (!ok) return false;
    }
    return true;
}

std::expected<ProjectContext, Error> load_active_project(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return ProjectContext{};

    std::ifstream f(path);
    if (!f.is_open()) {
        return std::unexpected(Error{ErrorKind::Configuration, std::format("could not open {}", path)});
    }

    try {
        auto j = json::parse(f);
        ProjectContext ctx{j.value("name", std::string{})};
        if (ctx.active() && !valid_project_key(ctx.name)) {
            return std::unexpected(Error{ErrorKind::Configuration,
                                         std::format("invalid project name '{}' in {}", ctx.name, path)});
        }
        return ctx;
    } catch (const json::exception& e) {
        return std::unexpected(Error{ErrorKind::Configuration,
                                     std::format("parse error in {}: {}", path, e.what())});
    }
}

std::expected<void, Error> save_active_project(const std::string& path, const ProjectContext& ctx) {
    std::error_code ec;
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);

    auto tmp = path + ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f.is_open()) {
            return std::unexpected(Error{ErrorKind::TransientIo, std::format("could not write {}", tmp)});
        }
        f << json{{"name", ctx.name}}.dump() << '\n';
        if (!f.good()) {
            return std::unexpected(Error{ErrorKind::TransientIo, std::format("short write to {}", tmp)});
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        auto reason = ec.message();
        fs::remove(tmp, ec);
        return std::unexpected(Error{ErrorKind::TransientIo,
                                     std::format("could not replace {}: {}", path, reason)});
    }
    return {};
}
