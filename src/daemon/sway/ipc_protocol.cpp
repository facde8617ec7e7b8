#include "ipc_protocol.hpp"

#include <cstring>
#include <format>

std::string encode_frame(uint32_t type, std::string_view payload) {
    uint32_t len = static_cast<uint32_t>(payload.size());

    std::string frame(IPC_HEADER_LEN, '\0');
    std::memcpy(frame.data(), IPC_MAGIC, IPC_MAGIC_LEN);
    std::memcpy(frame.data() + 6, &len, 4);
    std::memcpy(frame.data() + 10, &type, 4);
    frame.append(payload);
    return frame;
}

std::expected<FrameHeader, Error> decode_header(std::span<const char, IPC_HEADER_LEN> header) {
    if (std::memcmp(header.data(), IPC_MAGIC, IPC_MAGIC_LEN) != 0) {
        return std::unexpected(Error{ErrorKind::Protocol, "bad magic in frame header"});
    }

    FrameHeader h;
    std::memcpy(&h.length, header.data() + 6, 4);
    std::memcpy(&h.type, header.data() + 10, 4);

    if (h.length > IPC_MAX_PAYLOAD) {
        return std::unexpected(Error{ErrorKind::Protocol,
                                     std::format("payload length {} exceeds limit", h.length)});
    }
    return h;
}
