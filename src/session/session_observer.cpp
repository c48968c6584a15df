#include "filejet/session/session_observer.hpp"

namespace filejet::session {

const char* to_string(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::DISCONNECTED: return "disconnected";
        case ConnectionStatus::CONNECTING:   return "connecting";
        case ConnectionStatus::CONNECTED:    return "connected";
    }
    return "unknown";
}

const char* to_string(NoticeLevel level) {
    switch (level) {
        case NoticeLevel::INFO:    return "info";
        case NoticeLevel::WARNING: return "warning";
        case NoticeLevel::ERROR:   return "error";
    }
    return "unknown";
}

} // namespace filejet::session
