#include "filejet/session/node_config.hpp"
#include "filejet/core/logger.hpp"

namespace filejet::session {

NodeConfig NodeConfig::from_config(const core::Config& config) {
    NodeConfig node_config;
    
    node_config.traversal.ice_servers = config.get_list("network.ice_servers", "stun:stun.l.google.com:19302");
    node_config.traversal.bind_address = config.get_string("network.bind_address", "0.0.0.0");
    node_config.traversal.advertised_hosts = config.get_list("network.advertised_hosts", "127.0.0.1");
    
    node_config.transfer.chunk_size = config.get_size("transfer.chunk_size", transfer::DEFAULT_CHUNK_SIZE);
    node_config.transfer.buffer_threshold = config.get_size("transfer.buffer_threshold",
                                                            transfer::DEFAULT_BUFFER_THRESHOLD);
    node_config.transfer.buffer_low_threshold = config.get_size("transfer.buffer_low_threshold",
                                                                transfer::DEFAULT_BUFFER_LOW_THRESHOLD);
    
    auto valid = node_config.transfer.validate();
    if (!valid.success()) {
        LOG_WARN("Invalid transfer settings ({}), using defaults", valid.message);
        node_config.transfer = transfer::TransferOptions{};
    }
    
    return node_config;
}

} // namespace filejet::session
