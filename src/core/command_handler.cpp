#include "filejet/core/command_handler.hpp"
#include "filejet/core/config.hpp"
#include "filejet/core/logger.hpp"
#include "filejet/core/utils.hpp"
#include "filejet/crypto/random.hpp"
#include "filejet/network/tcp_transport.hpp"
#include "filejet/session/peer_node.hpp"
#include "filejet/signaling/session_id.hpp"
#include "filejet/signaling/sqlite_rendezvous_store.hpp"
#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <csignal>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <iostream>
#include <optional>

namespace filejet::core {

namespace {
    constexpr std::chrono::seconds ANSWER_TIMEOUT{60};
    
    // Event loop, rendezvous store, TCP substrate and the local node for one
    // command invocation.
    class NodeRuntime {
    public:
        NodeRuntime()
            : signals_(io_context_, SIGINT, SIGTERM) {
        }
        
        core::Result open(const Config& config) {
            if (!crypto::SecureRandom::initialize()) {
                return core::Result(ErrorCode::INVALID_STATE, "Failed to initialize random number generator");
            }
            
            auto database = utils::FileUtils::expand_home(
                config.get_string("rendezvous.database", "filejet_rendezvous.db"));
            auto poll_interval = std::chrono::milliseconds(config.get_size("rendezvous.poll_interval_ms", 200));
            
            store_ = std::make_shared<signaling::SqliteRendezvousStore>(io_context_, database, poll_interval);
            if (!store_->initialize()) {
                return core::Result(ErrorCode::STORE_UNAVAILABLE,
                                    "Cannot open rendezvous database " + database.string());
            }
            
            factory_ = std::make_shared<network::TcpConnectionFactory>(io_context_);
            node_ = std::make_unique<session::PeerNode>(io_context_, store_, factory_,
                                                        session::NodeConfig::from_config(config));
            
            signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
                if (ec) {
                    return;
                }
                LOG_INFO("Received signal {}, shutting down", signal_number);
                std::cout << "\nInterrupted\n";
                shutdown();
            });
            return core::Result();
        }
        
        void run() {
            io_context_.run();
        }
        
        // Lets the event loop run dry: queued frames are still flushed.
        void shutdown() {
            if (node_) {
                node_->stop();
            }
            if (store_) {
                store_->close();
            }
            boost::system::error_code ec;
            signals_.cancel(ec);
        }
        
        boost::asio::io_context& io_context() { return io_context_; }
        session::PeerNode& node() { return *node_; }
        
    private:
        boost::asio::io_context io_context_;
        boost::asio::signal_set signals_;
        std::shared_ptr<signaling::SqliteRendezvousStore> store_;
        std::shared_ptr<network::TcpConnectionFactory> factory_;
        std::unique_ptr<session::PeerNode> node_;
    };
    
    // Prints session events and exposes the interesting ones as hooks.
    class ConsoleObserver : public session::SessionObserver {
    public:
        std::function<void()> connected;
        std::function<void()> disconnected;
        std::function<void()> sent;
        std::function<void(const transfer::ReceivedFile&)> received;
        
        void on_connection_status(session::ConnectionStatus status) override {
            std::cout << "Status: " << session::to_string(status) << "\n";
            if (status == session::ConnectionStatus::CONNECTED && connected) {
                connected();
            } else if (status == session::ConnectionStatus::DISCONNECTED && disconnected) {
                disconnected();
            }
        }
        
        void on_file_info(const std::string& file_name, std::uint64_t file_size) override {
            file_name_ = file_name;
            file_size_ = file_size;
            last_percent_ = -1;
        }
        
        void on_transfer_mode(transfer::TransferMode mode) override {
            if (mode != transfer::TransferMode::IDLE) {
                std::cout << (mode == transfer::TransferMode::SENDING ? "Sending " : "Receiving ")
                          << file_name_ << " (" << utils::StringUtils::format_bytes(file_size_) << ")\n";
            }
        }
        
        void on_progress(double percent) override {
            int whole = static_cast<int>(percent);
            if (whole == last_percent_ || file_name_.empty()) {
                return;
            }
            last_percent_ = whole;
            std::cout << "\r  " << std::setw(3) << whole << "%" << std::flush;
            if (whole >= 100) {
                std::cout << "\n";
            }
        }
        
        void on_file_sent(const std::string&, std::uint64_t) override {
            if (sent) sent();
        }
        
        void on_file_received(const transfer::ReceivedFile& file) override {
            if (received) received(file);
        }
        
        void on_notice(const session::Notice& notice) override {
            auto& out = notice.level == session::NoticeLevel::INFO ? std::cout : std::cerr;
            out << notice.title << ": " << notice.description << "\n";
        }
        
    private:
        std::string file_name_;
        std::uint64_t file_size_ = 0;
        int last_percent_ = -1;
    };
}

CommandResult IdCommandHandler::execute(const std::vector<std::string>&) {
    if (!crypto::SecureRandom::initialize()) {
        return CommandResult::error("Failed to initialize random number generator");
    }
    std::cout << signaling::generate_session_id() << "\n";
    return CommandResult::ok();
}

CommandResult SaveConfigCommandHandler::execute(const std::vector<std::string>& args) {
    auto path = utils::FileUtils::expand_home(args[1]);
    auto saved = Config::instance().save_to_file(path.string());
    if (!saved.success()) {
        return CommandResult::error(saved.message);
    }
    std::cout << "Configuration written to " << path.string() << "\n";
    return CommandResult::ok();
}

CommandResult ReceiveCommandHandler::execute(const std::vector<std::string>&) {
    auto& config = Config::instance();
    auto output_dir = utils::FileUtils::expand_home(config.get_string("transfer.output_dir", "."));
    
    NodeRuntime runtime;
    auto opened = runtime.open(config);
    if (!opened.success()) {
        return CommandResult::error(opened.message);
    }
    
    std::optional<CommandResult> outcome;
    auto finish = [&runtime, &outcome](CommandResult result) {
        if (outcome) {
            return;
        }
        outcome = std::move(result);
        boost::asio::post(runtime.io_context(), [&runtime]() { runtime.shutdown(); });
    };
    
    ConsoleObserver console;
    console.received = [&finish, &output_dir](const transfer::ReceivedFile& file) {
        std::filesystem::path saved;
        auto result = transfer::save_received_file(file, output_dir, saved);
        if (!result.success()) {
            finish(CommandResult::error(result.message));
            return;
        }
        std::cout << "Saved " << saved.string() << " ("
                  << utils::StringUtils::format_bytes(file.data.size()) << ")\n";
        finish(CommandResult::ok("File received"));
    };
    runtime.node().set_observer(&console);
    
    auto started = runtime.node().start(config.get_string("node.id", ""));
    if (!started.success()) {
        return CommandResult::error(started.message);
    }
    
    std::cout << "Your ID: " << runtime.node().get_local_id() << "\n";
    std::cout << "Waiting for a sender... (Ctrl+C to stop)\n";
    
    runtime.run();
    
    if (!outcome) {
        return CommandResult::error("Stopped before a file arrived", 130);
    }
    return *outcome;
}

CommandResult SendCommandHandler::execute(const std::vector<std::string>& args) {
    const auto& recipient = args[1];
    std::filesystem::path file_path = utils::FileUtils::expand_home(args[2]);
    
    if (!signaling::is_valid_session_id(recipient)) {
        return CommandResult::error("Invalid ID: please enter a valid 6-digit ID");
    }
    if (!utils::FileUtils::is_file(file_path)) {
        return CommandResult::error("File does not exist: " + file_path.string());
    }
    
    auto& config = Config::instance();
    NodeRuntime runtime;
    auto opened = runtime.open(config);
    if (!opened.success()) {
        return CommandResult::error(opened.message);
    }
    
    boost::asio::steady_timer answer_timer(runtime.io_context());
    std::optional<CommandResult> outcome;
    bool connected = false;
    
    auto finish = [&runtime, &outcome, &answer_timer](CommandResult result) {
        if (outcome) {
            return;
        }
        outcome = std::move(result);
        answer_timer.cancel();
        boost::asio::post(runtime.io_context(), [&runtime]() { runtime.shutdown(); });
    };
    
    ConsoleObserver console;
    console.connected = [&]() {
        if (connected) {
            return;
        }
        connected = true;
        answer_timer.cancel();
        
        // The channel opens right after the connection reports connected.
        boost::asio::post(runtime.io_context(), [&]() {
            auto result = runtime.node().send_file(file_path);
            if (!result.success()) {
                finish(CommandResult::error(result.message));
            }
        });
    };
    console.sent = [&finish]() {
        finish(CommandResult::ok("File sent"));
    };
    console.disconnected = [&finish]() {
        finish(CommandResult::error("Connection lost"));
    };
    runtime.node().set_observer(&console);
    
    auto started = runtime.node().start(config.get_string("node.id", ""));
    if (!started.success()) {
        return CommandResult::error(started.message);
    }
    
    std::cout << "Your ID: " << runtime.node().get_local_id() << "\n";
    std::cout << "Connecting to " << recipient << "...\n";
    
    auto connecting = runtime.node().connect(recipient);
    if (!connecting.success()) {
        runtime.shutdown();
        return CommandResult::error(connecting.message);
    }
    
    answer_timer.expires_after(ANSWER_TIMEOUT);
    answer_timer.async_wait([&finish, &recipient](const boost::system::error_code& ec) {
        if (!ec) {
            finish(CommandResult::error("No answer from " + recipient));
        }
    });
    
    runtime.run();
    
    if (!outcome) {
        return CommandResult::error("Interrupted", 130);
    }
    return *outcome;
}

} // namespace filejet::core
