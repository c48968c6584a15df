#include <benchmark/benchmark.h>
#include "filejet/core/logger.hpp"
#include "filejet/network/loopback_transport.hpp"
#include "filejet/network/tcp_link.hpp"
#include "filejet/session/peer_node.hpp"
#include "filejet/signaling/memory_rendezvous_store.hpp"
#include "filejet/signaling/signaling_session.hpp"
#include "filejet/transfer/file_receiver.hpp"
#include "filejet/transfer/transfer_message.hpp"
#include <algorithm>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <vector>

using namespace filejet;

static void BM_MetadataEncode(benchmark::State& state) {
    transfer::MetadataMessage metadata{"holiday photos 2024.tar.gz", 734003200};
    
    for (auto _ : state) {
        auto encoded = transfer::encode_control(metadata);
        benchmark::DoNotOptimize(encoded);
    }
    
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_MetadataEncode);

static void BM_ControlDecode(benchmark::State& state) {
    auto encoded = transfer::encode_control(transfer::MetadataMessage{"report.pdf", 1048576});
    
    for (auto _ : state) {
        auto decoded = transfer::decode_message(network::ChannelMessage{encoded});
        benchmark::DoNotOptimize(decoded);
    }
    
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ControlDecode);

static void BM_FrameHeaderRoundTrip(benchmark::State& state) {
    network::FrameKind kind;
    std::uint32_t length = 0;
    
    for (auto _ : state) {
        auto header = network::encode_frame_header(network::FrameKind::BINARY, 16384);
        bool ok = network::decode_frame_header(header, kind, length);
        benchmark::DoNotOptimize(ok);
        benchmark::DoNotOptimize(length);
    }
    
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_FrameHeaderRoundTrip);

static void BM_CandidateParse(benchmark::State& state) {
    auto wire = signaling::serialize_candidate(network::IceCandidate{"tcp 192.168.1.20 40213", "0"});
    
    for (auto _ : state) {
        network::IceCandidate candidate;
        auto result = signaling::parse_candidate(wire, candidate);
        benchmark::DoNotOptimize(result);
    }
    
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_CandidateParse);

// Reassembly of a file of range(0) bytes in 16 KiB chunks
static void BM_ReceiverReassembly(benchmark::State& state) {
    const std::size_t file_size = static_cast<std::size_t>(state.range(0));
    const std::size_t chunk_size = 16384;
    
    std::vector<std::uint8_t> block(chunk_size);
    std::mt19937 gen(42);
    std::generate(block.begin(), block.end(), [&gen]() { return static_cast<std::uint8_t>(gen()); });
    
    transfer::FileReceiver receiver;
    
    for (auto _ : state) {
        receiver.handle_metadata(transfer::MetadataMessage{"bench.bin", file_size});
        
        std::size_t remaining = file_size;
        while (remaining > 0) {
            auto length = std::min(remaining, chunk_size);
            receiver.handle_chunk(transfer::ChunkMessage{
                network::BinaryMessage(block.begin(), block.begin() + static_cast<std::ptrdiff_t>(length))});
            remaining -= length;
        }
        
        transfer::ReceivedFile file;
        auto result = receiver.handle_eof(file);
        benchmark::DoNotOptimize(result);
        benchmark::DoNotOptimize(file.data.data());
    }
    
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ReceiverReassembly)->Range(64 * 1024, 16 * 1024 * 1024);

// Two connected nodes over the in-process substrate
class LoopbackBenchmarkFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State&) override {
        spdlog::set_level(spdlog::level::warn);
        
        store_ = std::make_shared<signaling::MemoryRendezvousStore>(io_context_);
        auto network = std::make_shared<network::LoopbackNetwork>(io_context_);
        auto factory = std::make_shared<network::LoopbackConnectionFactory>(network);
        
        sender_ = std::make_unique<session::PeerNode>(io_context_, store_, factory, session::NodeConfig{});
        receiver_ = std::make_unique<session::PeerNode>(io_context_, store_, factory, session::NodeConfig{});
        
        if (!sender_->start("482913").success() || !receiver_->start("000111").success() ||
            !sender_->connect("000111").success()) {
            return;
        }
        run();
    }
    
    void TearDown(const ::benchmark::State&) override {
        sender_.reset();
        receiver_.reset();
        run();
        store_.reset();
    }

protected:
    void run() {
        io_context_.restart();
        io_context_.run();
    }
    
    bool connected() const {
        return sender_->get_connection_status() == session::ConnectionStatus::CONNECTED &&
               receiver_->get_connection_status() == session::ConnectionStatus::CONNECTED;
    }
    
    boost::asio::io_context io_context_;
    std::shared_ptr<signaling::MemoryRendezvousStore> store_;
    std::unique_ptr<session::PeerNode> sender_;
    std::unique_ptr<session::PeerNode> receiver_;
};

BENCHMARK_DEFINE_F(LoopbackBenchmarkFixture, FileTransfer)(benchmark::State& state) {
    if (!connected()) {
        state.SkipWithError("Loopback peers failed to connect");
        return;
    }
    
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const std::string content(file_size, 'x');
    
    for (auto _ : state) {
        auto result = sender_->send_stream("bench.bin", std::make_unique<std::istringstream>(content), file_size);
        if (!result.success()) {
            state.SkipWithError(result.message.c_str());
            break;
        }
        run();
        benchmark::DoNotOptimize(receiver_->get_received_file());
    }
    
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(LoopbackBenchmarkFixture, FileTransfer)->Range(64 * 1024, 8 * 1024 * 1024);
