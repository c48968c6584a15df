#include <gtest/gtest.h>
#include "filejet/core/utils.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace filejet::core::utils;

class StringUtilsTest : public ::testing::Test {};

TEST_F(StringUtilsTest, Split) {
    auto result = StringUtils::split("a,b,c", ',');
    EXPECT_EQ(result.size(), 3);
    EXPECT_EQ(result[0], "a");
    EXPECT_EQ(result[1], "b");
    EXPECT_EQ(result[2], "c");
    
    auto empty = StringUtils::split("", ',');
    EXPECT_EQ(empty.size(), 1);
    EXPECT_EQ(empty[0], "");
    
    auto trailing = StringUtils::split("tcp 127.0.0.1 ", ' ');
    EXPECT_EQ(trailing.size(), 3);
    EXPECT_EQ(trailing[2], "");
}

TEST_F(StringUtilsTest, Join) {
    std::vector<std::string> parts = {"a", "b", "c"};
    auto result = StringUtils::join(parts, ",");
    EXPECT_EQ(result, "a,b,c");
    
    std::vector<std::string> empty;
    auto empty_result = StringUtils::join(empty, ",");
    EXPECT_EQ(empty_result, "");
}

TEST_F(StringUtilsTest, Trim) {
    EXPECT_EQ(StringUtils::trim("  hello  "), "hello");
    EXPECT_EQ(StringUtils::trim("hello"), "hello");
    EXPECT_EQ(StringUtils::trim("   "), "");
    EXPECT_EQ(StringUtils::trim(""), "");
    EXPECT_EQ(StringUtils::trim("\tvalue\r\n"), "value");
}

TEST_F(StringUtilsTest, ToLower) {
    EXPECT_EQ(StringUtils::to_lower("Hello World"), "hello world");
    
    // Bytes above 0x7f are negative as plain char and pass through unchanged.
    EXPECT_EQ(StringUtils::to_lower("CAF\xC9"), "caf\xC9");
    EXPECT_EQ(StringUtils::to_lower("\xFF\x80Z"), "\xFF\x80z");
}

TEST_F(StringUtilsTest, SplitList) {
    auto servers = StringUtils::split_list(" stun:a.example:3478 , ,turn:b.example ");
    ASSERT_EQ(servers.size(), 2);
    EXPECT_EQ(servers[0], "stun:a.example:3478");
    EXPECT_EQ(servers[1], "turn:b.example");
    
    EXPECT_TRUE(StringUtils::split_list("").empty());
}

TEST_F(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(StringUtils::format_bytes(1024), "1.00 KB");
    EXPECT_EQ(StringUtils::format_bytes(1048576), "1.00 MB");
    EXPECT_EQ(StringUtils::format_bytes(500), "500.00 B");
}

TEST_F(StringUtilsTest, FormatDuration) {
    EXPECT_EQ(StringUtils::format_duration(std::chrono::milliseconds(250)), "250ms");
    EXPECT_EQ(StringUtils::format_duration(std::chrono::milliseconds(42000)), "42s");
    EXPECT_EQ(StringUtils::format_duration(std::chrono::milliseconds(125000)), "2m 5s");
    EXPECT_EQ(StringUtils::format_duration(std::chrono::milliseconds(3720000)), "1h 2m");
}

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_file = "test_file.txt";
        test_dir = "test_dir";
    }
    
    void TearDown() override {
        if (std::filesystem::exists(test_file)) {
            std::filesystem::remove(test_file);
        }
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }
    
    std::string test_file;
    std::string test_dir;
};

TEST_F(FileUtilsTest, Exists) {
    EXPECT_FALSE(FileUtils::exists(test_file));
    
    std::ofstream file(test_file);
    file << "test";
    file.close();
    
    EXPECT_TRUE(FileUtils::exists(test_file));
}

TEST_F(FileUtilsTest, IsFile) {
    std::ofstream file(test_file);
    file << "test";
    file.close();
    
    EXPECT_TRUE(FileUtils::is_file(test_file));
    
    ASSERT_TRUE(FileUtils::create_directories(test_dir));
    EXPECT_FALSE(FileUtils::is_file(test_dir));
}

TEST_F(FileUtilsTest, CreateDirectories) {
    EXPECT_TRUE(FileUtils::create_directories(test_dir + "/nested/deeper"));
    EXPECT_TRUE(FileUtils::exists(test_dir + "/nested/deeper"));
    
    // Already existing is fine.
    EXPECT_TRUE(FileUtils::create_directories(test_dir));
}

TEST_F(FileUtilsTest, FileSize) {
    std::string content = "Hello, World!";
    std::ofstream file(test_file, std::ios::binary);
    file << content;
    file.close();
    
    auto size = FileUtils::file_size(test_file);
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(*size, content.length());
    
    EXPECT_FALSE(FileUtils::file_size("missing_file.bin").has_value());
}

TEST_F(FileUtilsTest, ExpandHome) {
    EXPECT_EQ(FileUtils::expand_home("relative/path"), std::filesystem::path("relative/path"));
    
    const char* home = std::getenv("HOME");
    if (home) {
        EXPECT_EQ(FileUtils::expand_home("~/.filejet.conf"),
                  std::filesystem::path(home) / ".filejet.conf");
    }
}

TEST_F(FileUtilsTest, SanitizeFileName) {
    EXPECT_EQ(FileUtils::sanitize_file_name("report.pdf"), "report.pdf");
    EXPECT_EQ(FileUtils::sanitize_file_name("../../etc/passwd"), "passwd");
    EXPECT_EQ(FileUtils::sanitize_file_name("C:\\Users\\me\\photo.jpg"), "photo.jpg");
    EXPECT_EQ(FileUtils::sanitize_file_name("what?.txt"), "what_.txt");
    EXPECT_EQ(FileUtils::sanitize_file_name(".."), "received.bin");
    EXPECT_EQ(FileUtils::sanitize_file_name("dir/"), "received.bin");
    EXPECT_EQ(FileUtils::sanitize_file_name("   ", "fallback.dat"), "fallback.dat");
}
