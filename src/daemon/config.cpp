#include "config.hpp"

#include "platform/platform_paths.hpp"
#include "state/mark_codec.hpp"

#include <charconv>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <limits>
#include <optional>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

using SectionResult = std::expected<void, std::string>;

SectionResult read_int(const json& obj, const char* key, int min, int max, int& out) {
    if (!obj.contains(key)) return {};
    const auto& v = obj[key];
    if (!v.is_number_integer()) return std::unexpected(std::format("{} must be an integer", key));
    auto n = v.get<int64_t>();
    if (n < min || n > max) {
        return std::unexpected(std::format("{} = {} is outside [{}, {}]", key, n, min, max));
    }
    out = static_cast<int>(n);
    return {};
}

// Parses one section into a copy of the current value and commits it only
// when the whole section is valid.
template <typename T, typename Parse>
void load_section(const json& root, const char* key, T& target, Parse parse) {
    if (!root.contains(key)) return;
    T candidate = target;
    try {
        auto res = parse(root[key], candidate);
        if (!res) {
            std::println(stderr, "config: rejecting {} section: {}", key, res.error());
            return;
        }
    } catch (const json::exception& e) {
        std::println(stderr, "config: rejecting {} section: {}", key, e.what());
        return;
    }
    target = std::move(candidate);
}

SectionResult parse_gaps(const json& j, GapConfig& g) {
    if (!j.is_object()) return std::unexpected("expected an object");
    for (auto [key, field] : {std::pair{"top", &g.top}, std::pair{"bottom", &g.bottom},
                              std::pair{"left", &g.left}, std::pair{"right", &g.right}}) {
        if (auto r = read_int(j, key, 0, GapConfig::MAX_GAP, *field); !r) return r;
    }
    return {};
}

SectionResult parse_window(const json& j, Config::Window& w) {
    if (!j.is_object()) return std::unexpected("expected an object");
    if (auto r = read_int(j, "width", 1, 5000, w.width); !r) return r;
    return read_int(j, "height", 1, 3000, w.height);
}

SectionResult parse_cursor(const json& j, Config::Cursor& c) {
    if (!j.is_object()) return std::unexpected("expected an object");
    if (auto r = read_int(j, "query_timeout_ms", 1, 5000, c.query_timeout_ms); !r) return r;
    if (auto r = read_int(j, "cache_ttl_ms", 0, 60000, c.cache_ttl_ms); !r) return r;
    if (j.contains("command")) {
        auto cmd = j["command"].get<std::vector<std::string>>();
        if (cmd.empty() || cmd.front().empty()) return std::unexpected("command must not be empty");
        c.command = std::move(cmd);
    }
    return {};
}

SectionResult parse_reconnect(const json& j, Config::Reconnect& r) {
    if (!j.is_object()) return std::unexpected("expected an object");
    constexpr int max_ms = 10 * 60 * 1000;
    if (auto res = read_int(j, "base_ms", 1, max_ms, r.base_ms); !res) return res;
    if (auto res = read_int(j, "cap_ms", 1, max_ms, r.cap_ms); !res) return res;
    if (auto res = read_int(j, "command_timeout_ms", 1, 60000, r.command_timeout_ms); !res) return res;
    if (j.contains("factor")) {
        if (!j["factor"].is_number()) return std::unexpected("factor must be a number");
        r.factor = j["factor"].get<double>();
        if (r.factor < 1.0 || r.factor > 10.0) {
            return std::unexpected(std::format("factor = {} is outside [1, 10]", r.factor));
        }
    }
    if (r.cap_ms < r.base_ms) return std::unexpected("cap_ms must not be below base_ms");
    return {};
}

SectionResult parse_marks(const json& j, Config::Marks& m) {
    if (!j.is_object()) return std::unexpected("expected an object");
    if (j.contains("prefix")) {
        auto prefix = j["prefix"].get<std::string>();
        if (prefix.empty() || prefix.size() > MAX_MARK_PREFIX_LENGTH ||
            prefix.find_first_of(":|,\" ") != std::string::npos) {
            return std::unexpected(std::format("invalid mark prefix '{}'", prefix));
        }
        m.prefix = std::move(prefix);
    }
    return {};
}

SectionResult parse_positioning(const json& j, Config::Positioning& p) {
    if (!j.is_object()) return std::unexpected("expected an object");
    if (j.contains("follow_cursor")) p.follow_cursor = j["follow_cursor"].get<bool>();
    return {};
}

SectionResult parse_reconcile(const json& j, Config::Reconcile& r) {
    if (!j.is_object()) return std::unexpected("expected an object");
    return read_int(j, "stagger_ms", 0, 50, r.stagger_ms);
}

// Bad rules are dropped one by one; only a non-array rejects the section.
SectionResult parse_rules(const json& j, std::vector<ClassificationRule>& rules) {
    if (!j.is_array()) return std::unexpected("expected an array");

    std::vector<ClassificationRule> loaded;
    for (size_t i = 0; i < j.size(); ++i) {
        const auto& r = j[i];
        try {
            ClassificationRule rule;
            rule.pattern = r.at("pattern").get<std::string>();

            auto type = pattern_type_from_string(r.value("type", "class"));
            auto scope = scope_from_string(r.value("scope", "scoped"));
            auto source = rule_source_from_string(r.value("source", "user"));
            if (!type || !scope || !source) {
                std::println(stderr, "config: rule {} has an unknown type, scope or source", i);
                continue;
            }
            rule.type = *type;
            rule.scope = *scope;
            rule.source = *source;
            rule.priority = r.value("priority", 50);

            if (auto valid = validate_rule(rule); !valid) {
                std::println(stderr, "config: rule {} rejected: {}", i, valid.error().message);
                continue;
            }
            loaded.push_back(std::move(rule));
        } catch (const json::exception& e) {
            std::println(stderr, "config: rule {} rejected: {}", i, e.what());
        }
    }
    rules = std::move(loaded);
    return {};
}

std::optional<int> env_int(const char* name) {
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    std::string_view s(v);
    int n = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
    if (ec != std::errc{} || ptr != s.data() + s.size() || s.empty()) {
        return std::numeric_limits<int>::min();  // present but unparsable: fails validation
    }
    return n;
}

} // namespace

GapConfig apply_gap_env_overrides(const GapConfig& gaps) {
    GapConfig out = gaps;
    if (auto v = env_int("I3RUN_TOP_GAP")) out.top = *v;
    if (auto v = env_int("I3RUN_BOTTOM_GAP")) out.bottom = *v;
    if (auto v = env_int("I3RUN_LEFT_GAP")) out.left = *v;
    if (auto v = env_int("I3RUN_RIGHT_GAP")) out.right = *v;

    if (!out.valid()) {
        std::println(stderr, "config: ignoring I3RUN_*_GAP overrides, each must be an integer in [0, {}]",
                     GapConfig::MAX_GAP);
        return gaps;
    }
    return out;
}

Config Config::load(const std::string& path, const Config& previous) {
    Config cfg = previous;

    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, keeping current settings", path);
    } else {
        try {
            auto j = json::parse(f);
            if (j.is_object()) {
                load_section(j, "gaps", cfg.gaps, parse_gaps);
                load_section(j, "window", cfg.window, parse_window);
                load_section(j, "cursor", cfg.cursor, parse_cursor);
                load_section(j, "reconnect", cfg.reconnect, parse_reconnect);
                load_section(j, "marks", cfg.marks, parse_marks);
                load_section(j, "positioning", cfg.positioning, parse_positioning);
                load_section(j, "reconcile", cfg.reconcile, parse_reconcile);
                load_section(j, "rules", cfg.rules, parse_rules);
            } else {
                std::println(stderr, "config: {} is not a JSON object", path);
            }
        } catch (const json::exception& e) {
            std::println(stderr, "config: parse error: {}", e.what());
        }
    }

    cfg.gaps = apply_gap_env_overrides(cfg.gaps);
    return cfg;
}

Config Config::load_default(const Config& previous) {
    auto path = default_path();
    if (!path.empty() && fs::exists(path)) {
        return load(path, previous);
    }
    Config cfg = previous;
    cfg.gaps = apply_gap_env_overrides(cfg.gaps);
    return cfg;
}

std::string Config::default_path() {
    auto dir = platform::config_dir();
    if (dir.empty()) return {};
    return (fs::path(dir) / "config.json").string();
}
