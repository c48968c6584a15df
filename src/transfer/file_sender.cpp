#include "filejet/transfer/file_sender.hpp"
#include "filejet/transfer/transfer_message.hpp"
#include "filejet/core/logger.hpp"
#include <algorithm>

namespace filejet::transfer {

const char* to_string(SenderState state) {
    switch (state) {
        case SenderState::IDLE:              return "idle";
        case SenderState::STREAMING:         return "streaming";
        case SenderState::WAITING_FOR_DRAIN: return "waiting-for-drain";
        case SenderState::COMPLETED:         return "completed";
        case SenderState::FAILED:            return "failed";
        case SenderState::CANCELLED:         return "cancelled";
    }
    return "unknown";
}

FileSender::FileSender(boost::asio::io_context& io_context,
                       std::shared_ptr<network::DataChannel> channel,
                       TransferOptions options)
    : io_context_(io_context)
    , channel_(std::move(channel))
    , options_(options)
    , state_(SenderState::IDLE)
    , file_size_(0)
    , offset_(0)
    , chunks_sent_(0)
    , drain_waits_(0)
{
}

FileSender::~FileSender() {
    if (is_active()) {
        release_channel();
    }
}

bool FileSender::is_active() const {
    return state_ == SenderState::STREAMING || state_ == SenderState::WAITING_FOR_DRAIN;
}

core::Result FileSender::start(std::string name, std::unique_ptr<std::istream> source, std::uint64_t size) {
    if (state_ != SenderState::IDLE) {
        return core::Result(core::ErrorCode::INVALID_STATE,
                            std::string("Sender already used, state ") + to_string(state_));
    }
    
    auto valid = options_.validate();
    if (!valid.success()) {
        return valid;
    }
    if (!source || !*source) {
        return core::Result(core::ErrorCode::INVALID_INPUT, "File source is not readable");
    }
    if (!channel_ || !channel_->is_open()) {
        return core::Result(core::ErrorCode::INVALID_INPUT, "Channel is not open");
    }
    
    file_name_ = std::move(name);
    source_ = std::move(source);
    file_size_ = size;
    chunk_buffer_.resize(options_.chunk_size);
    
    if (!channel_->send(encode_control(MetadataMessage{file_name_, file_size_}))) {
        state_ = SenderState::CANCELLED;
        return core::Result(core::ErrorCode::CONNECTION_FAILURE, "Channel refused metadata");
    }
    
    state_ = SenderState::STREAMING;
    channel_->set_buffered_amount_low_threshold(options_.buffer_low_threshold);
    
    LOG_INFO("Sending '{}' ({} bytes, {} byte chunks)", file_name_, file_size_, options_.chunk_size);
    schedule_pump();
    return core::Result();
}

void FileSender::cancel() {
    if (!is_active()) {
        return;
    }
    state_ = SenderState::CANCELLED;
    release_channel();
    LOG_INFO("Sending '{}' cancelled after {} of {} bytes", file_name_, offset_, file_size_);
}

void FileSender::schedule_pump() {
    auto weak_self = weak_from_this();
    boost::asio::post(io_context_, [weak_self]() {
        if (auto self = weak_self.lock()) {
            self->pump();
        }
    });
}

void FileSender::pump() {
    if (state_ != SenderState::STREAMING) {
        return;
    }
    
    for (std::size_t sent_this_turn = 0; ; ++sent_this_turn) {
        if (!channel_->is_open()) {
            abort("channel closed");
            return;
        }
        
        if (offset_ >= file_size_) {
            finish();
            return;
        }
        
        if (channel_->buffered_amount() > options_.buffer_threshold) {
            wait_for_drain();
            return;
        }
        
        if (sent_this_turn >= options_.chunks_per_turn) {
            schedule_pump();
            return;
        }
        
        auto wanted = static_cast<std::size_t>(
            std::min<std::uint64_t>(options_.chunk_size, file_size_ - offset_));
        source_->read(reinterpret_cast<char*>(chunk_buffer_.data()), static_cast<std::streamsize>(wanted));
        auto got = static_cast<std::size_t>(source_->gcount());
        
        if (got != wanted) {
            fail(core::Result(core::ErrorCode::INVALID_INPUT,
                              "Source ended after " + std::to_string(offset_ + got) + " of " +
                              std::to_string(file_size_) + " bytes"));
            return;
        }
        
        if (!channel_->send(std::span<const std::uint8_t>(chunk_buffer_.data(), got))) {
            refused("chunk");
            return;
        }
        
        offset_ += got;
        chunks_sent_++;
        
        if (auto handler = progress_handler_) {
            handler(progress_percent(offset_, file_size_), offset_);
        }
        
        // A handler may have cancelled us.
        if (state_ != SenderState::STREAMING) {
            return;
        }
    }
}

void FileSender::wait_for_drain() {
    state_ = SenderState::WAITING_FOR_DRAIN;
    drain_waits_++;
    LOG_TRACE("Sender waiting for drain at {} buffered bytes", channel_->buffered_amount());
    
    auto weak_self = weak_from_this();
    channel_->on_buffered_amount_low([weak_self]() {
        auto self = weak_self.lock();
        if (!self || self->state_ != SenderState::WAITING_FOR_DRAIN) {
            return;
        }
        self->channel_->on_buffered_amount_low(nullptr);
        self->state_ = SenderState::STREAMING;
        self->pump();
    });
}

void FileSender::finish() {
    if (!channel_->send(encode_control(EofMessage{}))) {
        refused("end of file");
        return;
    }
    
    state_ = SenderState::COMPLETED;
    release_channel();
    
    if (file_size_ == 0) {
        if (auto handler = progress_handler_) {
            handler(100.0, 0);
        }
    }
    
    LOG_INFO("Sent '{}' ({} bytes in {} chunks, {} drain waits)",
             file_name_, offset_, chunks_sent_, drain_waits_);
    if (auto handler = completion_handler_) {
        handler(core::Result());
    }
}

void FileSender::abort(const std::string& reason) {
    state_ = SenderState::CANCELLED;
    release_channel();
    LOG_INFO("Stopped sending '{}' at {} of {} bytes: {}", file_name_, offset_, file_size_, reason);
}

// Only a closed channel ends the send silently; an open channel that refuses
// data leaves the peer with a partial file, so the owner has to hear of it.
void FileSender::refused(const std::string& what) {
    if (!channel_->is_open()) {
        abort("channel closed before " + what);
        return;
    }
    fail(core::Result(core::ErrorCode::CONNECTION_FAILURE,
                      "Channel refused " + what + " after " + std::to_string(offset_) + " of " +
                      std::to_string(file_size_) + " bytes"));
}

void FileSender::fail(core::Result result) {
    state_ = SenderState::FAILED;
    release_channel();
    LOG_ERROR("Sending '{}' failed: {}", file_name_, result.message);
    if (auto handler = completion_handler_) {
        handler(result);
    }
}

void FileSender::release_channel() {
    if (channel_) {
        channel_->on_buffered_amount_low(nullptr);
    }
    source_.reset();
}

} // namespace filejet::transfer
