#include "filejet/transfer/file_receiver.hpp"
#include "filejet/transfer/transfer_options.hpp"
#include "filejet/core/logger.hpp"
#include "filejet/core/utils.hpp"
#include <fstream>

namespace filejet::transfer {

FileReceiver::FileReceiver()
    : receiving_(false)
    , file_size_(0)
    , bytes_received_(0)
{
}

core::Result FileReceiver::handle_metadata(const MetadataMessage& metadata) {
    if (receiving_) {
        LOG_WARN("New metadata for '{}' discards {} buffered bytes of '{}'",
                 metadata.name, bytes_received_, file_name_);
    }
    
    reset();
    receiving_ = true;
    file_name_ = metadata.name;
    file_size_ = metadata.size;
    
    LOG_INFO("Receiving '{}' ({} bytes)", file_name_, file_size_);
    return core::Result();
}

core::Result FileReceiver::handle_chunk(ChunkMessage chunk) {
    if (!receiving_) {
        return core::Result(core::ErrorCode::PROTOCOL_ERROR, "Chunk received before metadata");
    }
    
    auto length = static_cast<std::uint64_t>(chunk.data.size());
    if (length > file_size_ - bytes_received_) {
        return core::Result(core::ErrorCode::PROTOCOL_ERROR,
                            "Chunk overruns declared size of " + std::to_string(file_size_) + " bytes");
    }
    
    bytes_received_ += length;
    chunks_.push_back(std::move(chunk.data));
    return core::Result();
}

core::Result FileReceiver::handle_eof(ReceivedFile& file) {
    if (!receiving_) {
        return core::Result(core::ErrorCode::PROTOCOL_ERROR, "End of file received before metadata");
    }
    if (bytes_received_ != file_size_) {
        return core::Result(core::ErrorCode::PROTOCOL_ERROR,
                            "End of file after " + std::to_string(bytes_received_) + " of " +
                            std::to_string(file_size_) + " bytes");
    }
    
    file.name = file_name_;
    file.data.clear();
    file.data.reserve(static_cast<std::size_t>(bytes_received_));
    for (const auto& chunk : chunks_) {
        file.data.insert(file.data.end(), chunk.begin(), chunk.end());
    }
    
    chunks_.clear();
    receiving_ = false;
    
    LOG_INFO("Received '{}' ({} bytes)", file.name, file.data.size());
    return core::Result();
}

void FileReceiver::reset() {
    receiving_ = false;
    file_name_.clear();
    file_size_ = 0;
    bytes_received_ = 0;
    chunks_.clear();
}

double FileReceiver::get_progress_percentage() const {
    return progress_percent(bytes_received_, file_size_);
}

core::Result save_received_file(const ReceivedFile& file, const std::filesystem::path& directory,
                                std::filesystem::path& saved_path) {
    if (!core::utils::FileUtils::create_directories(directory)) {
        return core::Result(core::ErrorCode::INVALID_INPUT, "Cannot create directory " + directory.string());
    }
    
    std::filesystem::path name = core::utils::FileUtils::sanitize_file_name(file.name);
    auto target = directory / name;
    for (int attempt = 1; core::utils::FileUtils::exists(target); ++attempt) {
        target = directory / (name.stem().string() + " (" + std::to_string(attempt) + ")" + name.extension().string());
    }
    
    std::ofstream output(target, std::ios::binary);
    if (!output.is_open()) {
        return core::Result(core::ErrorCode::INVALID_INPUT, "Cannot create " + target.string());
    }
    
    output.write(reinterpret_cast<const char*>(file.data.data()), static_cast<std::streamsize>(file.data.size()));
    output.close();
    if (!output) {
        return core::Result(core::ErrorCode::INVALID_INPUT, "Failed writing " + target.string());
    }
    
    saved_path = target;
    LOG_INFO("Saved '{}' to {}", file.name, target.string());
    return core::Result();
}

} // namespace filejet::transfer
