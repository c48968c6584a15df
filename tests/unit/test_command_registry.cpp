#include <gtest/gtest.h>
#include "filejet/core/command_registry.hpp"
#include "filejet/core/config.hpp"
#include <cstdio>
#include <memory>
#include <sstream>

using namespace filejet::core;

namespace {
    class CountingHandler : public CommandHandler {
    public:
        explicit CountingHandler(int& calls) : calls_(calls) {}
        
        CommandResult execute(const std::vector<std::string>& args) override {
            ++calls_;
            return CommandResult::ok(args.back());
        }
        std::string get_description() const override { return "Counts its calls"; }
        std::string get_usage() const override { return "filejet count <word>"; }
        std::size_t arity() const override { return 1; }
        
    private:
        int& calls_;
    };
}

TEST(CommandRegistryTest, DispatchesByName) {
    int calls = 0;
    CommandRegistry registry;
    registry.register_command("count", std::make_unique<CountingHandler>(calls));
    
    auto result = registry.dispatch({"count", "hello"});
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, "hello");
    EXPECT_EQ(calls, 1);
}

TEST(CommandRegistryTest, ChecksArityBeforeRunning) {
    int calls = 0;
    CommandRegistry registry;
    registry.register_command("count", std::make_unique<CountingHandler>(calls));
    
    auto missing = registry.dispatch({"count"});
    EXPECT_FALSE(missing.success);
    EXPECT_EQ(missing.exit_code, 2);
    EXPECT_EQ(missing.message, "Usage: filejet count <word>");
    
    EXPECT_FALSE(registry.dispatch({"count", "a", "b"}).success);
    EXPECT_EQ(calls, 0);
}

TEST(CommandRegistryTest, UnknownAndEmptyCommands) {
    CommandRegistry registry;
    
    auto unknown = registry.dispatch({"upload", "x"});
    EXPECT_FALSE(unknown.success);
    EXPECT_EQ(unknown.message, "Unknown command: upload");
    
    EXPECT_FALSE(registry.dispatch({}).success);
    EXPECT_FALSE(registry.has_command("upload"));
}

TEST(CommandRegistryTest, ReRegisteringReplacesHandler) {
    int first = 0;
    int second = 0;
    CommandRegistry registry;
    registry.register_command("count", std::make_unique<CountingHandler>(first));
    registry.register_command("count", std::make_unique<CountingHandler>(second));
    
    registry.dispatch({"count", "x"});
    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 1);
}

TEST(CommandRegistryTest, BuiltinCommandsInHelpOrder) {
    auto registry = CommandRegistry::with_builtin_commands();
    
    std::ostringstream out;
    registry.print_help(out);
    auto text = out.str();
    
    auto id = text.find("  id\n");
    auto receive = text.find("  receive\n");
    auto send = text.find("  send\n");
    auto save = text.find("  save-config\n");
    ASSERT_NE(id, std::string::npos);
    ASSERT_NE(receive, std::string::npos);
    ASSERT_NE(send, std::string::npos);
    ASSERT_NE(save, std::string::npos);
    EXPECT_LT(id, receive);
    EXPECT_LT(receive, send);
    EXPECT_LT(send, save);
    EXPECT_NE(text.find("usage: filejet send <recipient-id> <file>"), std::string::npos);
}

TEST(CommandRegistryTest, SendRejectsBadRecipientBeforeConnecting) {
    auto registry = CommandRegistry::with_builtin_commands();
    
    auto result = registry.dispatch({"send", "12ab56", "whatever.txt"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Invalid ID: please enter a valid 6-digit ID");
    
    auto missing = registry.dispatch({"send", "482913", "definitely_missing_file.bin"});
    EXPECT_FALSE(missing.success);
    EXPECT_NE(missing.message.find("File does not exist"), std::string::npos);
}

TEST(CommandRegistryTest, SaveConfigWritesEffectiveSettings) {
    auto& config = Config::instance();
    config.clear();
    config.set_defaults();
    config.set("transfer.output_dir", "/srv/incoming");
    
    auto registry = CommandRegistry::with_builtin_commands();
    auto result = registry.dispatch({"save-config", "saved_filejet.conf"});
    ASSERT_TRUE(result.success) << result.message;
    
    Config reloaded;
    ASSERT_TRUE(reloaded.load_from_file("saved_filejet.conf").success());
    EXPECT_EQ(reloaded.get_string("transfer.output_dir"), "/srv/incoming");
    EXPECT_EQ(reloaded.get_size("transfer.chunk_size", 0), 16384u);
    
    std::remove("saved_filejet.conf");
    config.clear();
}
