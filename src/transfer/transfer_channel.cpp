#include "filejet/transfer/transfer_channel.hpp"
#include "filejet/core/logger.hpp"
#include <exception>

namespace filejet::transfer {

TransferChannel::TransferChannel(boost::asio::io_context& io_context,
                                 std::shared_ptr<network::DataChannel> channel,
                                 TransferOptions options,
                                 TransferListener& listener)
    : io_context_(io_context)
    , channel_(std::move(channel))
    , options_(options)
    , listener_(listener)
    , mode_(TransferMode::IDLE)
    , progress_(0.0)
    , file_size_(0)
    , bytes_transferred_(0)
    , attached_(false)
{
}

TransferChannel::~TransferChannel() {
    if (sender_) {
        sender_->cancel();
    }
}

void TransferChannel::attach() {
    if (attached_) {
        return;
    }
    attached_ = true;
    
    auto weak_self = weak_from_this();
    channel_->on_message([weak_self](network::ChannelMessage message) {
        if (auto self = weak_self.lock()) {
            self->handle_message(std::move(message));
        }
    });
}

void TransferChannel::detach() {
    if (sender_) {
        sender_->cancel();
        sender_.reset();
    }
    receiver_.reset();
    
    if (attached_) {
        channel_->on_message(nullptr);
        channel_->on_buffered_amount_low(nullptr);
        attached_ = false;
    }
    
    mode_ = TransferMode::IDLE;
    progress_ = 0.0;
    file_name_.clear();
    file_size_ = 0;
    bytes_transferred_ = 0;
}

core::Result TransferChannel::send_stream(const std::string& file_name, std::unique_ptr<std::istream> source,
                                          std::uint64_t size) {
    if (!channel_->is_open()) {
        return core::Result(core::ErrorCode::INVALID_INPUT,
                            "Please wait for the connection to be fully established.");
    }
    if (mode_ != TransferMode::IDLE) {
        return core::Result(core::ErrorCode::INVALID_STATE,
                            std::string("A transfer is already ") + to_string(mode_));
    }
    
    auto sender = std::make_shared<FileSender>(io_context_, channel_, options_);
    
    auto weak_self = weak_from_this();
    sender->on_progress([weak_self](double percent, std::uint64_t bytes) {
        if (auto self = weak_self.lock()) {
            self->report_progress(percent, bytes);
        }
    });
    sender->on_complete([weak_self](const core::Result& result) {
        if (auto self = weak_self.lock()) {
            self->handle_send_complete(result);
        }
    });
    
    // Streaming starts on a later turn, so announcing after start() is safe.
    auto result = sender->start(file_name, std::move(source), size);
    if (!result.success()) {
        return result;
    }
    
    sender_ = std::move(sender);
    begin(TransferMode::SENDING, file_name, size);
    return core::Result();
}

void TransferChannel::handle_message(network::ChannelMessage message) {
    TransferMessage decoded;
    try {
        decoded = decode_message(std::move(message));
    } catch (const std::exception& e) {
        LOG_WARN("Ignoring malformed control message: {}", e.what());
        return;
    }
    
    if (auto* metadata = std::get_if<MetadataMessage>(&decoded)) {
        handle_metadata(*metadata);
    } else if (auto* chunk = std::get_if<ChunkMessage>(&decoded)) {
        handle_chunk(std::move(*chunk));
    } else {
        handle_eof();
    }
}

void TransferChannel::handle_metadata(const MetadataMessage& metadata) {
    if (mode_ == TransferMode::SENDING) {
        fail(core::Result(core::ErrorCode::PROTOCOL_ERROR,
                          "Peer announced '" + metadata.name + "' while a send is in progress"));
        return;
    }
    
    receiver_.handle_metadata(metadata);
    begin(TransferMode::RECEIVING, metadata.name, metadata.size);
    if (metadata.size == 0) {
        report_progress(100.0, 0);
    }
}

void TransferChannel::handle_chunk(ChunkMessage chunk) {
    auto result = receiver_.handle_chunk(std::move(chunk));
    if (!result.success()) {
        fail(result);
        return;
    }
    report_progress(receiver_.get_progress_percentage(), receiver_.get_bytes_received());
}

void TransferChannel::handle_eof() {
    ReceivedFile file;
    auto result = receiver_.handle_eof(file);
    if (!result.success()) {
        fail(result);
        return;
    }
    
    report_progress(100.0, file.data.size());
    mode_ = TransferMode::IDLE;
    listener_.on_file_received(std::move(file));
}

void TransferChannel::handle_send_complete(const core::Result& result) {
    auto sender = std::move(sender_);
    sender_.reset();
    
    if (!result.success()) {
        fail(result);
        return;
    }
    
    progress_ = 100.0;
    mode_ = TransferMode::IDLE;
    listener_.on_file_sent(file_name_, file_size_);
}

void TransferChannel::fail(const core::Result& error) {
    LOG_ERROR("Transfer of '{}' failed: {}", file_name_, error.message);
    
    if (sender_) {
        sender_->cancel();
        sender_.reset();
    }
    receiver_.reset();
    mode_ = TransferMode::IDLE;
    
    listener_.on_transfer_failed(error);
}

void TransferChannel::begin(TransferMode mode, const std::string& file_name, std::uint64_t file_size) {
    mode_ = mode;
    progress_ = 0.0;
    file_name_ = file_name;
    file_size_ = file_size;
    bytes_transferred_ = 0;
    listener_.on_transfer_started(mode, file_name, file_size);
}

void TransferChannel::report_progress(double percent, std::uint64_t bytes) {
    // Progress only moves forward within one transfer.
    if (percent < progress_) {
        percent = progress_;
    }
    progress_ = percent;
    bytes_transferred_ = bytes;
    listener_.on_transfer_progress(mode_, percent, bytes);
}

} // namespace filejet::transfer
