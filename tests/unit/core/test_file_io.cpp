/**
 * @file test_file_io.cpp
 * @brief Unit tests for file_handle
 */

#include <gtest/gtest.h>

#include <kcenon/log_harvest/core/file_io.h>

#include "integration/test_fixtures.h"

#include <array>
#include <cstring>
#include <vector>

namespace kcenon::log_harvest::test {

class FileHandleTest : public TempDirectoryFixture {
protected:
    static auto bytes_of(const std::string& text) -> std::vector<std::byte> {
        std::vector<std::byte> out(text.size());
        std::memcpy(out.data(), text.data(), text.size());
        return out;
    }
};

TEST_F(FileHandleTest, DefaultHandleIsClosed) {
    file_handle handle;
    EXPECT_FALSE(handle.is_open());
}

TEST_F(FileHandleTest, OpenMissingFileFails) {
    auto result = file_handle::open_for_read(test_dir_ / "missing.log", access_pattern::sequential);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::file_open_error);
    EXPECT_NE(result.error().message.find("missing.log"), std::string::npos);
}

TEST_F(FileHandleTest, SequentialWriteThenRead) {
    auto path = test_dir_ / "seq.bin";
    {
        auto out = file_handle::open_for_write(path, access_pattern::sequential, true);
        ASSERT_TRUE(out.has_value()) << out.error().message;
        auto data = bytes_of("hello ");
        ASSERT_TRUE(out.value().write(data).has_value());
        data = bytes_of("world");
        ASSERT_TRUE(out.value().write(data).has_value());
    }

    auto in = file_handle::open_for_read(path, access_pattern::sequential);
    ASSERT_TRUE(in.has_value());

    std::array<std::byte, 64> buffer{};
    auto n = in.value().read(buffer);
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(n.value(), 11u);
    EXPECT_EQ(std::memcmp(buffer.data(), "hello world", 11), 0);

    auto eof = in.value().read(buffer);
    ASSERT_TRUE(eof.has_value());
    EXPECT_EQ(eof.value(), 0u);
}

TEST_F(FileHandleTest, PositionalWritesInAnyOrder) {
    auto path = test_dir_ / "random.bin";
    auto out = file_handle::open_for_write(path, access_pattern::random, true);
    ASSERT_TRUE(out.has_value());
    ASSERT_TRUE(out.value().resize(8).has_value());

    auto tail = bytes_of("5678");
    auto head = bytes_of("1234");
    ASSERT_TRUE(out.value().write_at(4, tail).has_value());
    ASSERT_TRUE(out.value().write_at(0, head).has_value());
    out.value().close();
    EXPECT_FALSE(out.value().is_open());

    auto content = read_file(path);
    EXPECT_EQ(std::string(content.begin(), content.end()), "12345678");
}

TEST_F(FileHandleTest, ReadAtOffset) {
    auto path = test_dir_ / "offset.bin";
    {
        std::ofstream file(path, std::ios::binary);
        file << "abcdefghij";
    }

    auto in = file_handle::open_for_read(path, access_pattern::random);
    ASSERT_TRUE(in.has_value());

    std::array<std::byte, 3> buffer{};
    auto n = in.value().read_at(6, buffer);
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(n.value(), 3u);
    EXPECT_EQ(std::memcmp(buffer.data(), "ghi", 3), 0);

    auto past_end = in.value().read_at(10, buffer);
    ASSERT_TRUE(past_end.has_value());
    EXPECT_EQ(past_end.value(), 0u);
}

TEST_F(FileHandleTest, ResizeExtendsWithZeros) {
    auto path = test_dir_ / "sized.bin";
    auto out = file_handle::open_for_write(path, access_pattern::random, true);
    ASSERT_TRUE(out.has_value());
    ASSERT_TRUE(out.value().resize(4096).has_value());
    out.value().close();

    EXPECT_EQ(std::filesystem::file_size(path), 4096u);
    auto content = read_file(path);
    EXPECT_TRUE(std::all_of(content.begin(), content.end(), [](char c) { return c == 0; }));
}

TEST_F(FileHandleTest, TruncateDiscardsExistingContent) {
    auto path = test_dir_ / "trunc.bin";
    write_random_file(path, 1000);

    {
        auto out = file_handle::open_for_write(path, access_pattern::sequential, true);
        ASSERT_TRUE(out.has_value());
    }

    EXPECT_EQ(std::filesystem::file_size(path), 0u);
}

TEST_F(FileHandleTest, MoveTransfersOwnership) {
    auto path = test_dir_ / "move.bin";
    auto out = file_handle::open_for_write(path, access_pattern::sequential, true);
    ASSERT_TRUE(out.has_value());

    file_handle moved = std::move(out.value());
    EXPECT_TRUE(moved.is_open());
    EXPECT_EQ(moved.path().string(), path.string());
}

TEST_F(FileHandleTest, CloseCheckedReleasesHandle) {
    auto path = test_dir_ / "closed.bin";
    auto out = file_handle::open_for_write(path, access_pattern::sequential, true);
    ASSERT_TRUE(out.has_value());
    auto data = bytes_of("persisted");
    ASSERT_TRUE(out.value().write(data).has_value());

    auto closed = out.value().close_checked();

    ASSERT_TRUE(closed.has_value()) << closed.error().message;
    EXPECT_FALSE(out.value().is_open());
    EXPECT_EQ(std::filesystem::file_size(path), 9u);
}

TEST_F(FileHandleTest, CloseCheckedOnClosedHandleSucceeds) {
    file_handle handle;
    EXPECT_TRUE(handle.close_checked().has_value());

    auto out = file_handle::open_for_write(test_dir_ / "twice.bin", access_pattern::random, true);
    ASSERT_TRUE(out.has_value());
    ASSERT_TRUE(out.value().close_checked().has_value());
    EXPECT_TRUE(out.value().close_checked().has_value());
}

}  // namespace kcenon::log_harvest::test
