/**
 * @file test_playback_buffer.cpp
 * @brief Tests for progressive playback exposure and artifact assembly
 */

#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "test_common.h"
#include "vsc/core/vsc_error.h"
#include "vsc/features/playback/vsc_playback_buffer.h"

using vsc_test::RecordingSink;

namespace {

std::vector<uint8_t> bytes(size_t count, uint8_t first) {
    std::vector<uint8_t> out(count);
    for (size_t i = 0; i < count; ++i) out[i] = static_cast<uint8_t>(first + i);
    return out;
}

}  // namespace

// =============================================================================
// PLAYABILITY
// =============================================================================

TEST(PlaybackBuffer, NotPlayableBelowThreshold) {
    vsc::PlaybackBufferConfig config;
    config.format = vsc::AudioFormat::Mp3;
    config.min_playable_bytes = 100;
    vsc::PlaybackBuffer buffer(config);
    RecordingSink sink;
    buffer.attach_sink(&sink);

    ASSERT_EQ(buffer.append(bytes(60, 0)), VSC_SUCCESS);
    EXPECT_FALSE(buffer.is_playable());
    EXPECT_EQ(buffer.bytes_received(), 60u);
    EXPECT_EQ(buffer.bytes_ready(), 0u);
    EXPECT_TRUE(sink.bytes.empty());
}

TEST(PlaybackBuffer, ThresholdExposesWholePrefixThenEveryAppend) {
    vsc::PlaybackBufferConfig config;
    config.min_playable_bytes = 100;
    vsc::PlaybackBuffer buffer(config);
    RecordingSink sink;
    buffer.attach_sink(&sink);

    auto first = bytes(60, 0);
    auto second = bytes(60, 60);
    auto third = bytes(5, 120);
    buffer.append(first);
    buffer.append(second);
    ASSERT_TRUE(buffer.is_playable());
    EXPECT_EQ(buffer.bytes_ready(), 120u);

    buffer.append(third);
    EXPECT_EQ(buffer.bytes_ready(), 125u);

    std::vector<uint8_t> expected = first;
    expected.insert(expected.end(), second.begin(), second.end());
    expected.insert(expected.end(), third.begin(), third.end());
    EXPECT_EQ(sink.bytes, expected);
    ASSERT_EQ(sink.offsets.size(), 2u);
    EXPECT_EQ(sink.offsets[0], 0u);
    EXPECT_EQ(sink.offsets[1], 120u);
}

TEST(PlaybackBuffer, WavThresholdNeverBelowHeader) {
    vsc::PlaybackBufferConfig config;
    config.format = vsc::AudioFormat::Wav;
    config.min_playable_bytes = 4;
    vsc::PlaybackBuffer buffer(config);

    EXPECT_EQ(buffer.playable_threshold(), vsc::WAV_HEADER_BYTES);
    buffer.append(bytes(40, 0));
    EXPECT_FALSE(buffer.is_playable());
    buffer.append(bytes(10, 40));
    EXPECT_TRUE(buffer.is_playable());
}

TEST(PlaybackBuffer, PcmExposureIsFrameAligned) {
    vsc::PlaybackBufferConfig config;
    config.format = vsc::AudioFormat::Pcm;
    config.min_playable_bytes = 1;
    vsc::PlaybackBuffer buffer(config);
    RecordingSink sink;
    buffer.attach_sink(&sink);

    buffer.append(bytes(5, 0));
    EXPECT_EQ(buffer.bytes_ready(), 4u);
    buffer.append(bytes(2, 5));
    EXPECT_EQ(buffer.bytes_ready(), 6u);
    EXPECT_EQ(sink.bytes.size(), 6u);

    // Seal flushes the odd trailing byte
    buffer.seal();
    EXPECT_EQ(buffer.bytes_ready(), 7u);
    EXPECT_EQ(sink.bytes.size(), 7u);
}

// =============================================================================
// SEAL / ARTIFACT
// =============================================================================

TEST(PlaybackBuffer, SealExposesShortAudioAndNotifiesSink) {
    vsc::PlaybackBufferConfig config;
    config.min_playable_bytes = 1000;
    vsc::PlaybackBuffer buffer(config);
    RecordingSink sink;
    buffer.attach_sink(&sink);

    buffer.append(bytes(10, 0));
    EXPECT_FALSE(buffer.is_playable());

    ASSERT_EQ(buffer.seal(), VSC_SUCCESS);
    EXPECT_TRUE(buffer.is_sealed());
    EXPECT_TRUE(buffer.is_playable());
    EXPECT_EQ(sink.bytes.size(), 10u);
    EXPECT_EQ(sink.complete_count, 1);

    // Sealing twice is a no-op
    EXPECT_EQ(buffer.seal(), VSC_SUCCESS);
    EXPECT_EQ(sink.complete_count, 1);
}

TEST(PlaybackBuffer, AppendAfterSealFails) {
    vsc::PlaybackBuffer buffer{vsc::PlaybackBufferConfig()};
    buffer.seal();
    EXPECT_EQ(buffer.append(bytes(1, 0)), VSC_ERROR_BUFFER_SEALED);
}

TEST(PlaybackBuffer, ArtifactRequiresSeal) {
    vsc::PlaybackBuffer buffer{vsc::PlaybackBufferConfig()};
    buffer.append(bytes(3, 0));

    std::shared_ptr<const vsc::AudioArtifact> artifact;
    EXPECT_EQ(buffer.to_downloadable_artifact(artifact), VSC_ERROR_NOT_SEALED);
    EXPECT_EQ(artifact, nullptr);
}

TEST(PlaybackBuffer, ArtifactIsExactConcatenationAndStable) {
    vsc::PlaybackBufferConfig config;
    config.format = vsc::AudioFormat::Opus;
    vsc::PlaybackBuffer buffer(config);

    auto a = bytes(7, 1);
    auto b = bytes(3, 50);
    buffer.append(a);
    buffer.append(b);
    buffer.seal();

    std::shared_ptr<const vsc::AudioArtifact> first;
    std::shared_ptr<const vsc::AudioArtifact> second;
    ASSERT_EQ(buffer.to_downloadable_artifact(first), VSC_SUCCESS);
    ASSERT_EQ(buffer.to_downloadable_artifact(second), VSC_SUCCESS);
    EXPECT_EQ(first, second);

    std::vector<uint8_t> expected = a;
    expected.insert(expected.end(), b.begin(), b.end());
    EXPECT_EQ(first->bytes, expected);
    EXPECT_EQ(first->format, vsc::AudioFormat::Opus);
    EXPECT_EQ(first->content_type, "audio/opus");
}

TEST(PlaybackBuffer, EmptySealedBufferGivesEmptyArtifact) {
    vsc::PlaybackBuffer buffer{vsc::PlaybackBufferConfig()};
    buffer.seal();
    EXPECT_FALSE(buffer.is_playable());

    std::shared_ptr<const vsc::AudioArtifact> artifact;
    ASSERT_EQ(buffer.to_downloadable_artifact(artifact), VSC_SUCCESS);
    EXPECT_EQ(artifact->size(), 0u);
}

// =============================================================================
// DISCARD / SINK
// =============================================================================

TEST(PlaybackBuffer, DiscardIsIdempotentAndDetachesSink) {
    vsc::PlaybackBuffer buffer{vsc::PlaybackBufferConfig()};
    RecordingSink sink;
    buffer.attach_sink(&sink);
    buffer.append(bytes(4, 0));

    buffer.discard();
    buffer.discard();

    EXPECT_TRUE(buffer.is_discarded());
    EXPECT_EQ(sink.detached_count, 1);
    EXPECT_EQ(buffer.append(bytes(1, 0)), VSC_ERROR_BUFFER_DISCARDED);
    EXPECT_EQ(buffer.seal(), VSC_ERROR_BUFFER_DISCARDED);

    std::shared_ptr<const vsc::AudioArtifact> artifact;
    EXPECT_EQ(buffer.to_downloadable_artifact(artifact), VSC_ERROR_BUFFER_DISCARDED);
}

TEST(PlaybackBuffer, ArtifactOutlivesDiscard) {
    vsc::PlaybackBuffer buffer{vsc::PlaybackBufferConfig()};
    buffer.append(bytes(8, 0));
    buffer.seal();

    std::shared_ptr<const vsc::AudioArtifact> artifact;
    ASSERT_EQ(buffer.to_downloadable_artifact(artifact), VSC_SUCCESS);
    buffer.discard();

    EXPECT_EQ(artifact->size(), 8u);
}

TEST(PlaybackBuffer, LateSinkReceivesCurrentPrefix) {
    vsc::PlaybackBufferConfig config;
    config.min_playable_bytes = 4;
    vsc::PlaybackBuffer buffer(config);
    buffer.append(bytes(6, 0));

    RecordingSink sink;
    ASSERT_EQ(buffer.attach_sink(&sink), VSC_SUCCESS);
    EXPECT_EQ(sink.bytes, bytes(6, 0));
    ASSERT_EQ(sink.offsets.size(), 1u);
    EXPECT_EQ(sink.offsets[0], 0u);
    EXPECT_EQ(sink.complete_count, 0);
}

TEST(PlaybackBuffer, LateSinkAfterArtifactStillSeesAllBytes) {
    vsc::PlaybackBuffer buffer{vsc::PlaybackBufferConfig()};
    buffer.append(bytes(5, 9));
    buffer.seal();
    std::shared_ptr<const vsc::AudioArtifact> artifact;
    ASSERT_EQ(buffer.to_downloadable_artifact(artifact), VSC_SUCCESS);

    RecordingSink sink;
    buffer.attach_sink(&sink);
    EXPECT_EQ(sink.bytes, bytes(5, 9));
    EXPECT_EQ(sink.complete_count, 1);
}

TEST(PlaybackBuffer, ReplacingSinkDetachesPrevious) {
    vsc::PlaybackBuffer buffer{vsc::PlaybackBufferConfig()};
    RecordingSink first;
    RecordingSink second;
    buffer.attach_sink(&first);
    buffer.attach_sink(&second);
    EXPECT_EQ(first.detached_count, 1);
    EXPECT_EQ(second.detached_count, 0);
}
