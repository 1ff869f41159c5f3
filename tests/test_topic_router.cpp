#include <gtest/gtest.h>

#include "framestream/jpeg_codec.hpp"
#include "framestream/test_pattern.hpp"
#include "framestream/topic_router.hpp"

namespace framestream {
namespace {

Envelope jpeg_envelope(int channels) {
    const Image raw = make_test_pattern(32, 16, channels, 3);
    std::vector<uint8_t> compressed;
    std::string error;
    EXPECT_TRUE(encode_jpeg(raw, 90, compressed, error)) << error;

    Envelope envelope;
    envelope.topic = Topic::Jpeg;
    envelope.source_id = "cam";
    envelope.image.encoding = ImageEncoding::Jpeg;
    envelope.image.shape = raw.shape;
    envelope.image.data = compressed;
    return envelope;
}

TEST(TopicRouterTest, TopicNamesMapBothWays) {
    for (Topic topic : {Topic::Video, Topic::Jpeg, Topic::Log}) {
        EXPECT_EQ(topic_from_name(topic_name(topic)), topic);
    }
    EXPECT_EQ(topic_from_name("VideoFrame/srcA"), Topic::Unknown);
    EXPECT_EQ(topic_from_name(""), Topic::Unknown);
}

TEST(TopicRouterTest, RawVideoPassesThrough) {
    Envelope envelope;
    envelope.topic = Topic::Video;
    envelope.image = make_test_pattern(8, 8, 1, 0);
    const auto data = envelope.image.data;

    EXPECT_EQ(route(envelope), RouteStatus::Image);
    EXPECT_EQ(envelope.image.data, data);
}

TEST(TopicRouterTest, JpegIsDecodedToRawColor) {
    Envelope envelope = jpeg_envelope(3);
    ASSERT_EQ(route(envelope), RouteStatus::Image);
    EXPECT_EQ(envelope.image.encoding, ImageEncoding::Raw);
    EXPECT_EQ(envelope.image.dtype, "uint8");
    EXPECT_EQ(envelope.image.shape, (std::vector<int>{16, 32, 3}));
    EXPECT_EQ(envelope.image.data.size(), 16u * 32u * 3u);
}

TEST(TopicRouterTest, JpegIsDecodedToRawGray) {
    Envelope envelope = jpeg_envelope(1);
    ASSERT_EQ(route(envelope), RouteStatus::Image);
    EXPECT_EQ(envelope.image.shape, (std::vector<int>{16, 32}));
    EXPECT_EQ(envelope.image.data.size(), 16u * 32u);
}

TEST(TopicRouterTest, CorruptJpegIsDroppedWithoutExiting) {
    Envelope envelope;
    envelope.topic = Topic::Jpeg;
    envelope.image.encoding = ImageEncoding::Jpeg;
    envelope.image.data = {0x00, 0x01, 0x02, 0x03, 0x04};
    EXPECT_EQ(route(envelope), RouteStatus::Dropped);

    Envelope truncated = jpeg_envelope(3);
    truncated.image.data.resize(20);
    EXPECT_EQ(route(truncated), RouteStatus::Dropped);
}

// Rewrites the frame size in the baseline SOF0 segment without touching the
// scan data.
void patch_frame_size(std::vector<uint8_t>& jpeg, uint16_t width, uint16_t height) {
    for (size_t i = 0; i + 8 < jpeg.size(); ++i) {
        if (jpeg[i] == 0xFF && jpeg[i + 1] == 0xC0) {
            jpeg[i + 5] = static_cast<uint8_t>(height >> 8);
            jpeg[i + 6] = static_cast<uint8_t>(height & 0xFF);
            jpeg[i + 7] = static_cast<uint8_t>(width >> 8);
            jpeg[i + 8] = static_cast<uint8_t>(width & 0xFF);
            return;
        }
    }
    ADD_FAILURE() << "no SOF0 marker in encoded jpeg";
}

TEST(TopicRouterTest, OversizedJpegHeaderIsDroppedBeforeAllocating) {
    Envelope envelope = jpeg_envelope(3);
    patch_frame_size(envelope.image.data, 65500, 65500);
    EXPECT_LT(envelope.image.data.size(), 4096u);

    EXPECT_EQ(route(envelope), RouteStatus::Dropped);
    EXPECT_EQ(envelope.image.encoding, ImageEncoding::Jpeg);
}

TEST(TopicRouterTest, DecodedSizeLimitIsConfigurable) {
    Envelope small = jpeg_envelope(3);
    EXPECT_EQ(route(small, 16 * 32 * 3), RouteStatus::Image);

    Envelope over = jpeg_envelope(3);
    EXPECT_EQ(route(over, 16 * 32 * 3 - 1), RouteStatus::Dropped);
}

TEST(JpegCodecTest, LimitIsReportedThroughError) {
    Envelope envelope = jpeg_envelope(1);
    Image decoded;
    std::string error;
    EXPECT_FALSE(decode_jpeg(envelope.image.data.data(), envelope.image.data.size(), 100,
                             decoded, error));
    EXPECT_NE(error.find("limit"), std::string::npos) << error;
    EXPECT_TRUE(decoded.data.empty());
}

TEST(TopicRouterTest, LogAndUnknownTopics) {
    Envelope log;
    log.topic = Topic::Log;
    EXPECT_EQ(route(log), RouteStatus::Log);

    Envelope unknown;
    unknown.topic = Topic::Unknown;
    EXPECT_EQ(route(unknown), RouteStatus::Dropped);
}

TEST(JpegCodecTest, RejectsUnsupportedImages) {
    std::vector<uint8_t> out;
    std::string error;

    Image wide = make_test_pattern(4, 4, 3, 0);
    wide.dtype = "uint16";
    EXPECT_FALSE(encode_jpeg(wide, 90, out, error));

    Image four_channel = make_test_pattern(4, 4, 4, 0);
    EXPECT_FALSE(encode_jpeg(four_channel, 90, out, error));
    EXPECT_FALSE(error.empty());
}

} // namespace
} // namespace framestream
