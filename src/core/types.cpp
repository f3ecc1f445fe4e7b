#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NONE:         return "ok";
    case ErrorKind::VALIDATION:   return "validation error";
    case ErrorKind::DNS:          return "DNS resolution error";
    case ErrorKind::TIMEOUT:      return "connection timeout";
    case ErrorKind::AUTH:         return "authentication failed";
    case ErrorKind::PROTOCOL:     return "SSH protocol error";
    case ErrorKind::UNKNOWN:      return "unexpected error";
    case ErrorKind::STATE:        return "invalid session state";
    case ErrorKind::CHANNEL:      return "channel failure";
    case ErrorKind::EXEC_TIMEOUT: return "command timeout";
    case ErrorKind::HANG:         return "hang detected";
    case ErrorKind::INTERRUPTED:  return "interrupted";
    case ErrorKind::CLEANUP:      return "cleanup error";
    }
    return "unexpected error";
}
