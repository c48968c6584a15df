#pragma once

#include "filejet/transfer/file_receiver.hpp"
#include "filejet/transfer/transfer_options.hpp"
#include <cstdint>
#include <string>

namespace filejet::session {

enum class ConnectionStatus {
    DISCONNECTED,
    CONNECTING,
    CONNECTED
};

const char* to_string(ConnectionStatus status);

enum class NoticeLevel {
    INFO,
    WARNING,
    ERROR
};

const char* to_string(NoticeLevel level);

// Short user-facing message, e.g. {ERROR, "Disconnected", "Connection lost."}.
struct Notice {
    NoticeLevel level = NoticeLevel::INFO;
    std::string title;
    std::string description;
};

// Everything the user interface consumes. All callbacks run on the event loop.
class SessionObserver {
public:
    virtual ~SessionObserver() = default;
    
    virtual void on_connection_status(ConnectionStatus) {}
    virtual void on_transfer_mode(transfer::TransferMode) {}
    virtual void on_progress(double) {}
    virtual void on_file_info(const std::string&, std::uint64_t) {}
    virtual void on_file_sent(const std::string&, std::uint64_t) {}
    virtual void on_file_received(const transfer::ReceivedFile&) {}
    virtual void on_notice(const Notice&) {}
};

} // namespace filejet::session
