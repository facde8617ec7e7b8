#include "cursor/cursor_locator.hpp"

#include <charconv>
#include <exception>
#include <format>
#include <print>

namespace {

std::optional<int64_t> parse_int(std::string_view s) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size() || s.empty()) return std::nullopt;
    return value;
}

} // namespace

std::expected<PointerLocation, Error> parse_pointer_output(std::string_view output) {
    PointerLocation loc;
    bool have_x = false;
    bool have_y = false;

    while (!output.empty()) {
        auto nl = output.find('\n');
        auto line = output.substr(0, nl);
        output = nl == std::string_view::npos ? std::string_view{} : output.substr(nl + 1);

        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string_view::npos) continue;
        auto key = line.substr(0, eq);
        auto value = parse_int(line.substr(eq + 1));

        if (key == "X" || key == "Y") {
            if (!value) {
                return std::unexpected(Error{ErrorKind::Protocol,
                                             std::format("unparsable {} in pointer output", key)});
            }
            if (key == "X") {
                loc.x = static_cast<int>(*value);
                have_x = true;
            } else {
                loc.y = static_cast<int>(*value);
                have_y = true;
            }
        } else if (key == "SCREEN" && value) {
            loc.screen = static_cast<int>(*value);
        } else if (key == "WINDOW" && value) {
            loc.window = *value;
        }
    }

    if (!have_x || !have_y) {
        return std::unexpected(Error{ErrorKind::Protocol, "pointer output lacks X or Y"});
    }
    return loc;
}

CursorLocator::CursorLocator(CursorQuery& query, Settings settings, bool verbose, Clock clock)
    : query_(query), settings_(settings), verbose_(verbose), clock_(std::move(clock)) {}

CursorSample CursorLocator::locate() {
    auto now = clock_();

    if (auto loc = query_live()) {
        CursorSample sample{
            .x = loc->x,
            .y = loc->y,
            .source = CursorSource::Live,
            .valid = true,
            .timestamp = now,
        };
        cache_ = sample;
        stats_.live++;
        return sample;
    }

    if (cache_ && now - cache_->timestamp <= settings_.cache_ttl) {
        auto sample = *cache_;
        sample.source = CursorSource::Cached;
        stats_.cached++;
        log(std::format("cursor: using cached sample ({}, {})", sample.x, sample.y));
        return sample;
    }

    stats_.fallback++;
    log("cursor: no usable sample, falling back to workspace center");
    return CursorSample{
        .x = 0,
        .y = 0,
        .source = CursorSource::FallbackCenter,
        .valid = false,
        .timestamp = now,
    };
}

std::optional<PointerLocation> CursorLocator::query_live() {
    try {
        auto result = query_.query(settings_.query_timeout);
        if (result) return *result;
        log(std::format("cursor: query failed ({}): {}", to_string(result.error().kind),
                        result.error().message));
    } catch (const std::exception& e) {
        log(std::format("cursor: query threw: {}", e.what()));
    }
    return std::nullopt;
}

void CursorLocator::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[i3pm] {}", msg);
    }
}
