#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:           return "none";
        case ErrorKind::PRECONDITION:   return "precondition";
        case ErrorKind::TRANSPORT:      return "transport";
        case ErrorKind::AUTH:           return "auth";
        case ErrorKind::NOT_AUTHORIZED: return "not-authorized";
        case ErrorKind::DISCONNECTED:   return "disconnected";
        case ErrorKind::TIMEOUT:        return "timeout";
        case ErrorKind::REMOTE:         return "remote";
        case ErrorKind::LOCAL_IO:       return "local-io";
        case ErrorKind::BUSY:           return "busy";
    }
    return "unknown";
}
