#pragma once

#include "errors.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

// i3-ipc binary framing: "i3-ipc" (6 bytes) + payload length (u32) + type (u32),
// both integers in host byte order.
namespace ipc_msg {
inline constexpr uint32_t RUN_COMMAND = 0;
inline constexpr uint32_t GET_WORKSPACES = 1;
inline constexpr uint32_t SUBSCRIBE = 2;
inline constexpr uint32_t GET_OUTPUTS = 3;
inline constexpr uint32_t GET_TREE = 4;

inline constexpr uint32_t EVENT_BIT = 0x80000000;
inline constexpr uint32_t EVENT_WORKSPACE = 0x80000000;
inline constexpr uint32_t EVENT_OUTPUT = 0x80000001;
inline constexpr uint32_t EVENT_WINDOW = 0x80000003;
inline constexpr uint32_t EVENT_SHUTDOWN = 0x80000006;
} // namespace ipc_msg

inline constexpr char IPC_MAGIC[] = "i3-ipc";
inline constexpr size_t IPC_MAGIC_LEN = 6;
inline constexpr size_t IPC_HEADER_LEN = 14;

// Upper bound on a single payload. Trees of large sessions stay well below this.
inline constexpr uint32_t IPC_MAX_PAYLOAD = 64u * 1024u * 1024u;

struct FrameHeader {
    uint32_t length = 0;
    uint32_t type = 0;

    bool is_event() const { return (type & ipc_msg::EVENT_BIT) != 0; }
};

std::string encode_frame(uint32_t type, std::string_view payload);

std::expected<FrameHeader, Error> decode_header(std::span<const char, IPC_HEADER_LEN> header);
