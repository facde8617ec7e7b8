#include "errors.hpp"

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TransientIo: return "transient-io";
        case ErrorKind::Protocol: return "protocol";
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::StateDecode: return "state-decode";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::FatalHandshake: return "fatal-handshake";
    }
    return "unknown";
}
