#include <gtest/gtest.h>
#include "partvault/core/utils.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace partvault::core::utils;

class StringUtilsTest : public ::testing::Test {};

TEST_F(StringUtilsTest, Trim) {
    EXPECT_EQ(StringUtils::trim("  hello  "), "hello");
    EXPECT_EQ(StringUtils::trim("hello"), "hello");
    EXPECT_EQ(StringUtils::trim("   "), "");
    EXPECT_EQ(StringUtils::trim(""), "");
    EXPECT_EQ(StringUtils::trim("\t{\"task\":\"upload\"}\r\n"), "{\"task\":\"upload\"}");
}

TEST_F(StringUtilsTest, StartsWith) {
    EXPECT_TRUE(StringUtils::starts_with("hello world", "hello"));
    EXPECT_FALSE(StringUtils::starts_with("hello world", "world"));
    EXPECT_FALSE(StringUtils::starts_with("test", "testing"));
}

TEST_F(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(StringUtils::format_bytes(1024), "1.00 KB");
    EXPECT_EQ(StringUtils::format_bytes(19922944), "19.00 MB");
    EXPECT_EQ(StringUtils::format_bytes(500), "500.00 B");
}

TEST_F(StringUtilsTest, FormatDuration) {
    EXPECT_EQ(StringUtils::format_duration(std::chrono::milliseconds(250)), "250ms");
    EXPECT_EQ(StringUtils::format_duration(std::chrono::seconds(5)), "5s");
    EXPECT_EQ(StringUtils::format_duration(std::chrono::seconds(125)), "2m 5s");
}

TEST_F(StringUtilsTest, UrlEncode) {
    EXPECT_EQ(StringUtils::url_encode("AgACAg-_.~"), "AgACAg-_.~");
    EXPECT_EQ(StringUtils::url_encode("a b/c+d"), "a%20b%2Fc%2Bd");
}

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "partvault_utils_test";
        std::filesystem::remove_all(test_dir);
        test_file = test_dir / "test_file.txt";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::filesystem::path test_dir;
    std::filesystem::path test_file;
};

TEST_F(FileUtilsTest, CreateDirectoriesAndExists) {
    EXPECT_FALSE(FileUtils::exists(test_dir));
    EXPECT_TRUE(FileUtils::create_directories(test_dir / "nested"));
    EXPECT_TRUE(FileUtils::exists(test_dir / "nested"));
    EXPECT_FALSE(FileUtils::is_file(test_dir / "nested"));
}

TEST_F(FileUtilsTest, FileSize) {
    FileUtils::create_directories(test_dir);
    std::ofstream(test_file) << "Hello, World!";

    EXPECT_TRUE(FileUtils::is_file(test_file));
    auto size = FileUtils::file_size(test_file);
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(*size, 13u);

    EXPECT_FALSE(FileUtils::file_size(test_dir / "missing").has_value());
}

TEST_F(FileUtilsTest, ExpandUser) {
    auto home = FileUtils::get_home_dir();
    EXPECT_EQ(FileUtils::expand_user("~"), home);
    EXPECT_EQ(FileUtils::expand_user("~/.partvault"), home / ".partvault");
    EXPECT_EQ(FileUtils::expand_user("/etc/partvault.conf"), std::filesystem::path("/etc/partvault.conf"));
}

TEST_F(FileUtilsTest, ScopedRemovalDeletesTree) {
    FileUtils::create_directories(test_dir / "a" / "b");
    std::ofstream(test_dir / "a" / "b" / "part") << "x";

    {
        ScopedRemoval cleanup(test_dir / "a");
    }

    EXPECT_FALSE(FileUtils::exists(test_dir / "a"));
}

TEST_F(FileUtilsTest, ScopedRemovalRelease) {
    FileUtils::create_directories(test_dir / "keep");

    {
        ScopedRemoval cleanup(test_dir / "keep");
        cleanup.release();
    }

    EXPECT_TRUE(FileUtils::exists(test_dir / "keep"));
}

TEST_F(FileUtilsTest, CreateUniqueDirectorySkipsTakenNames) {
    std::filesystem::create_directories(test_dir);

    auto first = FileUtils::create_unique_directory(test_dir, "movie.mkv_parts");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, test_dir / "movie.mkv_parts");

    auto second = FileUtils::create_unique_directory(test_dir, "movie.mkv_parts");
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, test_dir / "movie.mkv_parts.1");

    std::ofstream(test_dir / "movie.mkv_parts.2") << "a file, not a directory";
    auto third = FileUtils::create_unique_directory(test_dir, "movie.mkv_parts");
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(*third, test_dir / "movie.mkv_parts.3");
    EXPECT_TRUE(std::filesystem::is_directory(*third));
}

TEST_F(FileUtilsTest, CreateUniqueDirectoryFailsWithoutParent) {
    EXPECT_FALSE(FileUtils::create_unique_directory(test_dir / "missing", "x_parts").has_value());
}
