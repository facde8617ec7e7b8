#pragma once

#include <string>

enum class ErrorKind {
    TransientIo,     // retried with backoff
    Protocol,        // malformed frame or reply, dropped
    Configuration,   // rejected at load, previous config kept
    StateDecode,     // undecodable mark, treated as absent state
    Timeout,         // cursor query or IPC round trip exceeded its budget
    FatalHandshake,  // initial connect/subscribe failed
};

struct Error {
    ErrorKind kind = ErrorKind::TransientIo;
    std::string message;

    bool retryable() const { return kind == ErrorKind::TransientIo || kind == ErrorKind::Timeout; }
};

const char* to_string(ErrorKind kind);
