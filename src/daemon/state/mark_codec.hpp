#pragma once

#include "errors.hpp"
#include "sway/window_record.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

// Everything this daemon remembers about a window lives in exactly one mark:
//   <prefix>:<project>|floating:true,x:100,y:200,w:1000,h:600,ts:1730934000,ws:1,mon:HEADLESS-1
// There is no second slot, so every write carries the complete state and an
// update is decode -> modify -> encode -> overwrite.
struct PersistedWindowState {
    std::string project;
    bool floating = true;
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
    int64_t timestamp = 0;  // epoch seconds
    int workspace = 1;
    std::string monitor;
    int64_t window_id = 0;  // optional trailing "id" field, 0 when absent

    bool operator==(const PersistedWindowState&) const = default;
};

inline constexpr size_t MAX_MARK_LENGTH = 500;
inline constexpr size_t MAX_MARK_PREFIX_LENGTH = 32;
inline constexpr int DEFAULT_STATE_WIDTH = 1000;
inline constexpr int DEFAULT_STATE_HEIGHT = 600;

class MarkCodec {
public:
    explicit MarkCodec(std::string prefix = "scratch");

    std::string encode(const PersistedWindowState& state) const;

    // As encode(), but refuses a mark longer than decode() accepts.
    std::expected<std::string, Error> encode_checked(const PersistedWindowState& state) const;

    // Fails closed: any malformed, missing, duplicated or unknown field yields nullopt.
    std::optional<PersistedWindowState> decode(std::string_view mark) const;

    // Project key of a mark owned by this codec. Also accepts legacy
    // identity-only marks ("<prefix>:<project>") that carry no state.
    std::optional<std::string> identity(std::string_view mark) const;

    bool owns(std::string_view mark) const;

    // First of the window's marks that this codec owns.
    std::optional<std::string> find_mark(const WindowRecord& window) const;

    const std::string& prefix() const { return prefix_; }

private:
    std::string prefix_;
};

// Read-modify-write helper: keeps fields of `prior` the window cannot report
// and refreshes geometry, placement, timestamp and owner.
PersistedWindowState capture_state(const std::optional<PersistedWindowState>& prior,
                                   const WindowRecord& window, const std::string& project,
                                   int64_t now);
