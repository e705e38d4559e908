#include <gtest/gtest.h>
#include "audio/RingBuffer.hpp"
#include <thread>
#include <vector>

TEST(RingBufferTest, WriteAndDrain) {
    RingBuffer buf(1024);
    float data[] = {1.0f, 2.0f, 3.0f};
    EXPECT_EQ(buf.write(data, 3), 3u);
    EXPECT_EQ(buf.available(), 3u);

    std::vector<float> out;
    EXPECT_EQ(buf.readInto(out, 16), 3u);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_FLOAT_EQ(out[0], 1.0f);
    EXPECT_FLOAT_EQ(out[2], 3.0f);
    EXPECT_EQ(buf.available(), 0u);
}

TEST(RingBufferTest, ReadAppendsToExistingSamples) {
    RingBuffer buf(16);
    float data[] = {7.0f, 8.0f};
    buf.write(data, 2);

    std::vector<float> out = {1.0f};
    buf.readInto(out, 2);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_FLOAT_EQ(out[0], 1.0f);
    EXPECT_FLOAT_EQ(out[1], 7.0f);
}

TEST(RingBufferTest, WrapAround) {
    RingBuffer buf(4);

    float data1[] = {1.0f, 2.0f, 3.0f};
    buf.write(data1, 3);

    std::vector<float> out;
    buf.readInto(out, 2);
    EXPECT_FLOAT_EQ(out[1], 2.0f);

    float data2[] = {4.0f, 5.0f};
    EXPECT_EQ(buf.write(data2, 2), 2u);
    EXPECT_EQ(buf.available(), 3u);

    out.clear();
    buf.readInto(out, 3);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_FLOAT_EQ(out[0], 3.0f);
    EXPECT_FLOAT_EQ(out[1], 4.0f);
    EXPECT_FLOAT_EQ(out[2], 5.0f);
}

TEST(RingBufferTest, OverflowIsCountedAsDropped) {
    RingBuffer buf(4);

    float data[8] = {1, 2, 3, 4, 5, 6, 7, 8};
    EXPECT_EQ(buf.write(data, 8), 4u);
    EXPECT_EQ(buf.available(), 4u);
    EXPECT_EQ(buf.dropped(), 4u);

    // Oldest samples are kept
    std::vector<float> out;
    buf.readInto(out, 4);
    EXPECT_FLOAT_EQ(out[0], 1.0f);
    EXPECT_FLOAT_EQ(out[3], 4.0f);
}

TEST(RingBufferTest, EmptyBufferReadsNothing) {
    RingBuffer buf(1024);
    std::vector<float> out;
    EXPECT_EQ(buf.readInto(out, 10), 0u);
    EXPECT_TRUE(out.empty());
}

TEST(RingBufferTest, ResetClearsPositionsAndDropCount) {
    RingBuffer buf(2);
    float data[] = {1.0f, 2.0f, 3.0f};
    buf.write(data, 3);
    EXPECT_EQ(buf.dropped(), 1u);

    buf.reset();
    EXPECT_EQ(buf.available(), 0u);
    EXPECT_EQ(buf.dropped(), 0u);
    EXPECT_EQ(buf.capacity(), 2u);
}

TEST(RingBufferTest, ProducerThreadDeliversInOrder) {
    RingBuffer buf(256);
    const int total = 20000;

    std::thread producer([&] {
        int next = 0;
        while (next < total) {
            float chunk[32];
            int n = std::min(32, total - next);
            for (int i = 0; i < n; i++) chunk[i] = static_cast<float>(next + i);
            // Only count what fit; retry the rest
            size_t space = buf.capacity() - buf.available();
            size_t w = buf.write(chunk, std::min<size_t>(n, space));
            next += static_cast<int>(w);
            if (w == 0) std::this_thread::yield();
        }
    });

    std::vector<float> out;
    while (out.size() < static_cast<size_t>(total)) {
        if (buf.readInto(out, 64) == 0) std::this_thread::yield();
    }
    producer.join();

    EXPECT_EQ(buf.dropped(), 0u);
    for (int i = 0; i < total; i++)
        ASSERT_FLOAT_EQ(out[i], static_cast<float>(i));
}
