#include "mark_codec.hpp"

#include <charconv>
#include <format>

namespace {

template <typename T>
bool parse_int(std::string_view s, T& out) {
    if (s.empty()) return false;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

} // namespace

MarkCodec::MarkCodec(std::string prefix)
    : prefix_(std::move(prefix)) {}

std::string MarkCodec::encode(const PersistedWindowState& s) const {
    auto mark = std::format("{}:{}|floating:{},x:{},y:{},w:{},h:{},ts:{},ws:{},mon:{}",
                            prefix_, s.project, s.floating ? "true" : "false",
                            s.x, s.y, s.width, s.height, s.timestamp, s.workspace, s.monitor);
    if (s.window_id != 0) {
        mark += std::format(",id:{}", s.window_id);
    }
    return mark;
}

std::expected<std::string, Error> MarkCodec::encode_checked(const PersistedWindowState& s) const {
    auto mark = encode(s);
    if (mark.size() > MAX_MARK_LENGTH) {
        return std::unexpected(Error{ErrorKind::Configuration,
                                     std::format("mark for project '{}' is {} bytes, limit is {}", s.project,
                                                 mark.size(), MAX_MARK_LENGTH)});
    }
    return mark;
}

std::optional<PersistedWindowState> MarkCodec::decode(std::string_view mark) const {
    if (mark.size() > MAX_MARK_LENGTH || !owns(mark)) return std::nullopt;

    auto body = mark.substr(prefix_.size() + 1);
    auto bar = body.find('|');
    if (bar == std::string_view::npos) return std::nullopt;  // identity-only

    PersistedWindowState s;
    s.project = std::string(body.substr(0, bar));
    if (s.project.empty()) return std::nullopt;

    enum Field : unsigned {
        FLOATING = 1u << 0, X = 1u << 1, Y = 1u << 2, W = 1u << 3, H = 1u << 4,
        TS = 1u << 5, WS = 1u << 6, MON = 1u << 7, ID = 1u << 8,
    };
    constexpr unsigned REQUIRED = FLOATING | X | Y | W | H | TS | WS | MON;
    unsigned seen = 0;

    auto fields = body.substr(bar + 1);
    while (!fields.empty()) {
        auto comma = fields.find(',');
        auto pair = fields.substr(0, comma);
        fields = comma == std::string_view::npos ? std::string_view{} : fields.substr(comma + 1);
        if (comma != std::string_view::npos && fields.empty()) return std::nullopt;  // trailing comma

        auto colon = pair.find(':');
        if (colon == std::string_view::npos) return std::nullopt;
        auto key = pair.substr(0, colon);
        auto value = pair.substr(colon + 1);

        unsigned bit = 0;
        bool ok = false;
        if (key == "floating") {
            bit = FLOATING;
            ok = value == "true" || value == "false";
            s.floating = value == "true";
        } else if (key == "x") {
            bit = X;
            ok = parse_int(value, s.x);
        } else if (key == "y") {
            bit = Y;
            ok = parse_int(value, s.y);
        } else if (key == "w") {
            bit = W;
            ok = parse_int(value, s.width) && s.width > 0;
        } else if (key == "h") {
            bit = H;
            ok = parse_int(value, s.height) && s.height > 0;
        } else if (key == "ts") {
            bit = TS;
            ok = parse_int(value, s.timestamp) && s.timestamp >= 0;
        } else if (key == "ws") {
            bit = WS;
            ok = parse_int(value, s.workspace);
        } else if (key == "mon") {
            bit = MON;
            s.monitor = std::string(value);
            ok = !value.empty();
        } else if (key == "id") {
            bit = ID;
            ok = parse_int(value, s.window_id) && s.window_id > 0;
        }

        if (!ok || (seen & bit)) return std::nullopt;
        seen |= bit;
    }

    if ((seen & REQUIRED) != REQUIRED) return std::nullopt;
    return s;
}

std::optional<std::string> MarkCodec::identity(std::string_view mark) const {
    if (mark.size() > MAX_MARK_LENGTH || !owns(mark)) return std::nullopt;
    auto body = mark.substr(prefix_.size() + 1);
    auto project = body.substr(0, body.find('|'));
    if (project.empty()) return std::nullopt;
    return std::string(project);
}

bool MarkCodec::owns(std::string_view mark) const {
    return mark.size() > prefix_.size() && mark.starts_with(prefix_) && mark[prefix_.size()] == ':';
}

std::optional<std::string> MarkCodec::find_mark(const WindowRecord& window) const {
    for (const auto& m : window.marks) {
        if (owns(m)) return m;
    }
    return std::nullopt;
}

PersistedWindowState capture_state(const std::optional<PersistedWindowState>& prior,
                                   const WindowRecord& window, const std::string& project,
                                   int64_t now) {
    PersistedWindowState s = prior.value_or(PersistedWindowState{});
    s.project = project;
    s.timestamp = now;
    s.window_id = window.id;

    // A window already parked in the scratchpad reports forced floating and
    // scratchpad geometry; only a visible window can refresh these.
    if (!window.in_scratchpad() || !prior) {
        s.floating = window.floating;
    }
    if (!window.in_scratchpad() && window.rect.width > 0 && window.rect.height > 0) {
        s.x = window.rect.x;
        s.y = window.rect.y;
        s.width = window.rect.width;
        s.height = window.rect.height;
    }
    if (!window.in_scratchpad()) {
        if (window.workspace_num >= 0) s.workspace = window.workspace_num;
        if (!window.output.empty()) s.monitor = window.output;
    }
    if (s.monitor.empty()) s.monitor = "unknown";
    if (s.width <= 0 || s.height <= 0) {
        s.width = window.rect.width > 0 ? window.rect.width : DEFAULT_STATE_WIDTH;
        s.height = window.rect.height > 0 ? window.rect.height : DEFAULT_STATE_HEIGHT;
    }
    return s;
}
