#pragma once

#include "filejet/core/result.hpp"
#include "filejet/transfer/transfer_message.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace filejet::transfer {

struct ReceivedFile {
    std::string name;
    std::vector<std::uint8_t> data;
};

// Writes the file into directory under its sanitized name, adding a numeric
// suffix instead of overwriting an existing file.
core::Result save_received_file(const ReceivedFile& file, const std::filesystem::path& directory,
                                std::filesystem::path& saved_path);

// Reassembles one incoming file from a metadata message, binary chunks and
// an end-of-file marker.
class FileReceiver {
public:
    FileReceiver();
    
    // Starts a new file, discarding whatever was buffered before.
    core::Result handle_metadata(const MetadataMessage& metadata);
    core::Result handle_chunk(ChunkMessage chunk);
    
    // Materializes the file. Fails unless exactly the declared size arrived.
    core::Result handle_eof(ReceivedFile& file);
    
    void reset();
    
    bool is_receiving() const { return receiving_; }
    const std::string& get_file_name() const { return file_name_; }
    std::uint64_t get_file_size() const { return file_size_; }
    std::uint64_t get_bytes_received() const { return bytes_received_; }
    std::size_t get_chunk_count() const { return chunks_.size(); }
    double get_progress_percentage() const;

private:
    bool receiving_;
    std::string file_name_;
    std::uint64_t file_size_;
    std::uint64_t bytes_received_;
    std::vector<network::BinaryMessage> chunks_;
};

} // namespace filejet::transfer
