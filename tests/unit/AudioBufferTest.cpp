#include <gtest/gtest.h>
#include "core/AudioBuffer.h"
#include "core/AudioSignal.h"
#include <memory>
#include <stdexcept>

using namespace SynthScan::Core;

class AudioBufferTest : public ::testing::Test {
protected:
    void SetUp() override {
        buffer = std::make_unique<AudioBuffer>(2, 1024);
    }

    void fill(int channel, float value) {
        float* data = buffer->getWritePointer(channel);
        for (int i = 0; i < buffer->getNumSamples(); ++i) {
            data[i] = value;
        }
    }

    std::unique_ptr<AudioBuffer> buffer;
};

TEST_F(AudioBufferTest, Construction) {
    EXPECT_EQ(buffer->getNumChannels(), 2);
    EXPECT_EQ(buffer->getNumSamples(), 1024);
}

TEST_F(AudioBufferTest, ConstructionStartsSilent) {
    for (int ch = 0; ch < buffer->getNumChannels(); ++ch) {
        for (float v : buffer->getChannel(ch)) {
            EXPECT_FLOAT_EQ(v, 0.0f);
        }
    }
}

TEST_F(AudioBufferTest, RejectsInvalidDimensions) {
    EXPECT_THROW(AudioBuffer(0, 100), std::invalid_argument);
    EXPECT_THROW(AudioBuffer(2, -1), std::invalid_argument);
    EXPECT_NO_THROW(AudioBuffer(1, 0));
}

TEST_F(AudioBufferTest, InvalidChannelThrows) {
    EXPECT_THROW(buffer->getReadPointer(2), std::out_of_range);
    EXPECT_THROW(buffer->getWritePointer(-1), std::out_of_range);
}

TEST_F(AudioBufferTest, FromInterleaved) {
    AudioBuffer planar = AudioBuffer::fromInterleaved({0.1f, -0.1f, 0.2f, -0.2f, 0.3f, -0.3f}, 2);

    EXPECT_EQ(planar.getNumChannels(), 2);
    EXPECT_EQ(planar.getNumSamples(), 3);
    EXPECT_EQ(planar.getChannel(0), (std::vector<float>{0.1f, 0.2f, 0.3f}));
    EXPECT_EQ(planar.getChannel(1), (std::vector<float>{-0.1f, -0.2f, -0.3f}));
}

TEST_F(AudioBufferTest, FromInterleavedRejectsPartialFrame) {
    EXPECT_THROW(AudioBuffer::fromInterleaved({0.1f, 0.2f, 0.3f}, 2), std::invalid_argument);
    EXPECT_THROW(AudioBuffer::fromInterleaved({0.1f}, 0), std::invalid_argument);
}

TEST_F(AudioBufferTest, GetChannelCopies) {
    fill(1, 0.75f);

    std::vector<float> copy = buffer->getChannel(1);
    copy[0] = 0.0f;
    EXPECT_FLOAT_EQ(buffer->getReadPointer(1)[0], 0.75f);
    EXPECT_THROW(buffer->getChannel(2), std::out_of_range);
}

TEST_F(AudioBufferTest, MixToMonoAveragesChannels) {
    fill(0, 0.2f);
    fill(1, -0.6f);

    std::vector<float> mono = buffer->mixToMono();
    ASSERT_EQ(mono.size(), 1024u);
    for (float v : mono) {
        EXPECT_FLOAT_EQ(v, -0.2f);
    }
}

TEST_F(AudioBufferTest, MoveTransfersOwnership) {
    fill(0, 0.25f);

    AudioBuffer moved(std::move(*buffer));
    EXPECT_EQ(moved.getNumChannels(), 2);
    EXPECT_EQ(moved.getNumSamples(), 1024);
    EXPECT_FLOAT_EQ(moved.getReadPointer(0)[10], 0.25f);
}

TEST(AudioSignalTest, DurationFromRate) {
    AudioSignal signal(std::vector<float>(32000, 0.0f), 16000);
    EXPECT_EQ(signal.size(), 32000u);
    EXPECT_EQ(signal.getSampleRate(), 16000);
    EXPECT_DOUBLE_EQ(signal.getDurationSeconds(), 2.0);
}

TEST(AudioSignalTest, RejectsNonPositiveRate) {
    EXPECT_THROW(AudioSignal({0.0f}, 0), std::invalid_argument);
}

TEST(AudioSignalTest, EmptySignal) {
    AudioSignal signal({}, 16000);
    EXPECT_TRUE(signal.empty());
    EXPECT_DOUBLE_EQ(signal.getDurationSeconds(), 0.0);
}
