// File: tests/processing/pair_comparator_test.cpp

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "processing/pair_comparator.hpp"
#include "support/mocks.hpp"
#include "support/synthetic_images.hpp"
#include "types/errors.hpp"

using processing::PairComparator;
using ::testing::Return;
using ::testing::Throw;
namespace support = tests::support;

class PairComparatorTest : public ::testing::Test {
protected:
    std::shared_ptr<support::MockImageDecoder> decoder = std::make_shared<support::MockImageDecoder>();
    types::DescriptorConfig config;
};

TEST_F(PairComparatorTest, DecodesBothImagesAndScoresThem) {
    EXPECT_CALL(*decoder, decode(std::filesystem::path("a.png")))
            .WillOnce(Return(support::buffer(support::ramp())));
    EXPECT_CALL(*decoder, decode(std::filesystem::path("b.png")))
            .WillOnce(Return(support::buffer(support::ramp())));

    const PairComparator comparator(config, decoder);
    const auto result = comparator.compare("a.png", "b.png");

    EXPECT_EQ(result.first, "a.png");
    EXPECT_EQ(result.second, "b.png");
    EXPECT_DOUBLE_EQ(result.score, 1.0);
}

TEST_F(PairComparatorTest, ScoreMatchesComparatorOnDescriptors) {
    ON_CALL(*decoder, decode(std::filesystem::path("ramp.png"))).WillByDefault(Return(support::buffer(support::ramp())));
    ON_CALL(*decoder, decode(std::filesystem::path("square.png")))
            .WillByDefault(Return(support::buffer(support::squareOnDark())));

    const PairComparator comparator(config, decoder);
    const double direct = comparator.score(comparator.describe("ramp.png"), comparator.describe("square.png"));

    EXPECT_DOUBLE_EQ(comparator.compare("ramp.png", "square.png").score, direct);
    EXPECT_DOUBLE_EQ(comparator.compare("square.png", "ramp.png").score, direct);
    EXPECT_LT(direct, 0.5);
}

TEST_F(PairComparatorTest, PropagatesDecodeErrors) {
    EXPECT_CALL(*decoder, decode(std::filesystem::path("missing.png")))
            .WillOnce(Throw(types::DecodeError("No such file: missing.png")));

    const PairComparator comparator(config, decoder);
    EXPECT_THROW((void) comparator.describe("missing.png"), types::DecodeError);
}

TEST_F(PairComparatorTest, InvalidBufferErrorsNameThePath) {
    EXPECT_CALL(*decoder, decode(std::filesystem::path("empty.png"))).WillOnce(Return(types::PixelBuffer()));

    const PairComparator comparator(config, decoder);
    try {
        (void) comparator.describe("empty.png");
        FAIL() << "Expected InvalidBufferError";
    } catch (const types::InvalidBufferError &e) {
        EXPECT_THAT(e.what(), ::testing::HasSubstr("empty.png"));
    }
}

TEST_F(PairComparatorTest, RejectsMissingDecoder) {
    EXPECT_THROW(PairComparator(config, nullptr), std::invalid_argument);
}

TEST(OpenCVImageDecoderTest, DecodesWrittenImage) {
    const support::TemporaryDirectory directory;
    const auto path = directory.writeImage("ramp.png", support::ramp(40, 30));

    const auto buffer = common::io::OpenCVImageDecoder().decode(path);
    EXPECT_EQ(buffer.width(), 40);
    EXPECT_EQ(buffer.height(), 30);
    EXPECT_EQ(buffer.channels(), 3);
}

TEST(OpenCVImageDecoderTest, ReportsUnreadableFilesAsDecodeErrors) {
    const support::TemporaryDirectory directory;
    const auto corrupt = directory.writeText("corrupt.png", "this is not an image");

    const common::io::OpenCVImageDecoder decoder;
    EXPECT_THROW((void) decoder.decode(corrupt), types::DecodeError);
    EXPECT_THROW((void) decoder.decode(directory.path() / "missing.png"), types::DecodeError);
}
