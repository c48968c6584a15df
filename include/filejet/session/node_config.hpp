#pragma once

#include "filejet/core/config.hpp"
#include "filejet/network/peer_connection.hpp"
#include "filejet/transfer/transfer_options.hpp"
#include <string>

namespace filejet::session {

constexpr const char* DATA_CHANNEL_LABEL = "fileTransfer";

struct NodeConfig {
    network::TraversalConfig traversal;
    transfer::TransferOptions transfer;
    std::string channel_label = DATA_CHANNEL_LABEL;
    
    static NodeConfig from_config(const core::Config& config);
};

} // namespace filejet::session
