/**
 * @file test_diagnostic_ring_buffer.cpp
 * @brief Unit tests for the bounded diagnostic tail
 */

#include <gtest/gtest.h>

#include <cloudxfer/core/diagnostic_ring_buffer.h>

#include <random>
#include <string>

namespace cloudxfer::test {

class DiagnosticRingBufferTest : public ::testing::Test {};

TEST_F(DiagnosticRingBufferTest, DefaultCapacity) {
    diagnostic_ring_buffer buffer;
    EXPECT_EQ(buffer.capacity(), 16u * 1024u);
    EXPECT_EQ(buffer.size(), 0u);
    EXPECT_EQ(buffer.snapshot(), "");
}

TEST_F(DiagnosticRingBufferTest, AppendsNewlineTerminatedLines) {
    diagnostic_ring_buffer buffer(64);
    buffer.append_line("first");
    buffer.append_line("second\n");

    EXPECT_EQ(buffer.raw(), "first\nsecond\n");
    EXPECT_EQ(buffer.snapshot(), "first\nsecond");
}

TEST_F(DiagnosticRingBufferTest, EmptyLineIgnored) {
    diagnostic_ring_buffer buffer(16);
    buffer.append_line("");
    EXPECT_EQ(buffer.size(), 0u);
}

TEST_F(DiagnosticRingBufferTest, EvictsOldestBytes) {
    diagnostic_ring_buffer buffer(10);
    buffer.append_line("aaaa");   // "aaaa\n"
    buffer.append_line("bbbb");   // "aaaa\nbbbb\n"
    buffer.append_line("cc");     // needs 3 more bytes

    EXPECT_EQ(buffer.raw(), "a\nbbbb\ncc\n");
    EXPECT_EQ(buffer.size(), 10u);
}

TEST_F(DiagnosticRingBufferTest, OversizedLineKeepsSuffix) {
    diagnostic_ring_buffer buffer(8);
    buffer.append_line("old");
    buffer.append_line("0123456789");

    EXPECT_EQ(buffer.raw(), "3456789\n");
    EXPECT_EQ(buffer.size(), 8u);
}

TEST_F(DiagnosticRingBufferTest, Clear) {
    diagnostic_ring_buffer buffer(8);
    buffer.append_line("x");
    buffer.clear();
    EXPECT_EQ(buffer.size(), 0u);
}

TEST_F(DiagnosticRingBufferTest, ContentIsAlwaysSuffixOfAppendedStream) {
    constexpr std::size_t capacity = 37;
    diagnostic_ring_buffer buffer(capacity);

    std::mt19937 gen(7);
    std::uniform_int_distribution<int> length(1, 60);
    std::uniform_int_distribution<int> letter('a', 'z');

    std::string stream;
    for (int i = 0; i < 500; ++i) {
        std::string line(static_cast<std::size_t>(length(gen)), ' ');
        for (auto& c : line) {
            c = static_cast<char>(letter(gen));
        }
        buffer.append_line(line);
        stream += line + "\n";

        auto content = buffer.raw();
        ASSERT_LE(content.size(), capacity);
        ASSERT_GE(stream.size(), content.size());
        ASSERT_EQ(stream.compare(stream.size() - content.size(), content.size(), content), 0)
            << "iteration " << i;
    }
}

}  // namespace cloudxfer::test
