// File: tests/processing/image/comparison/perceptual_hash_comparator_test.cpp

#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include "processing/image/comparison/perceptual_hash_comparator.hpp"
#include "processing/image/descriptor_builder.hpp"
#include "support/synthetic_images.hpp"

using namespace processing::image;
namespace support = tests::support;

class PerceptualHashComparatorTest : public ::testing::Test {
protected:
    PerceptualHashComparator comparator;
    types::DescriptorConfig config;

    void SetUp() override { config.method = types::DescriptorMethod::PerceptualHash; }

    types::ImageDescriptor describe(const cv::Mat &image) const {
        return DescriptorBuilder(config).build(support::buffer(image));
    }
};

TEST_F(PerceptualHashComparatorTest, IdenticalImagesScoreOne) {
    const auto descriptor = describe(support::squareOnDark());
    EXPECT_DOUBLE_EQ(comparator.compare(descriptor, descriptor), 1.0);
}

TEST_F(PerceptualHashComparatorTest, IsSymmetric) {
    const auto ramp = describe(support::ramp());
    const auto square = describe(support::squareOnDark());
    EXPECT_DOUBLE_EQ(comparator.compare(ramp, square), comparator.compare(square, ramp));
}

TEST_F(PerceptualHashComparatorTest, MirroredStructureLowersTheScore) {
    cv::Mat mirrored;
    cv::flip(support::ramp(), mirrored, 1);

    const double score = comparator.compare(describe(support::ramp()), describe(mirrored));
    EXPECT_GE(score, 0.0);
    EXPECT_LT(score, 1.0);
}

TEST_F(PerceptualHashComparatorTest, SlightNoiseKeepsTheHash) {
    const auto clean = describe(support::ramp());
    const auto noisy = describe(support::withNoise(support::ramp(), 5.0, 1));
    EXPECT_DOUBLE_EQ(comparator.compare(clean, noisy), 1.0);
}

TEST_F(PerceptualHashComparatorTest, FlatImagesFallBackToBrightness) {
    const auto dark = describe(support::uniform(32, 32, cv::Scalar::all(10)));
    const auto bright = describe(support::uniform(32, 32, cv::Scalar::all(200)));

    ASSERT_TRUE(dark.hash()->flat);
    ASSERT_TRUE(bright.hash()->flat);
    EXPECT_NEAR(comparator.compare(dark, bright), 1.0 - 190.0 / 255.0, 1e-9);
    EXPECT_LT(comparator.compare(dark, bright), 0.5);
}

TEST_F(PerceptualHashComparatorTest, FlatImagesOfDifferentColorsAreNotAlike) {
    // Pure red converts to gray 76, the same gray as the second image
    const auto red = describe(support::uniform(32, 32, cv::Scalar(0, 0, 255)));
    const auto gray = describe(support::uniform(32, 32, cv::Scalar::all(76)));

    ASSERT_TRUE(red.hash()->flat);
    ASSERT_TRUE(gray.hash()->flat);
    EXPECT_NE(red, gray);
    EXPECT_NEAR(comparator.compare(red, gray), 1.0 - 179.0 / 255.0, 1e-9);
    EXPECT_LT(comparator.compare(red, gray), 0.5);
}

TEST_F(PerceptualHashComparatorTest, DifferentHashSizesAreNotComparable) {
    const auto regular = describe(support::ramp());
    config.dct_size = 4;
    const auto small = describe(support::ramp());

    EXPECT_THROW((void) comparator.compare(regular, small), types::ConfigurationMismatchError);
}

TEST_F(PerceptualHashComparatorTest, DescriptorsWithoutHashAreRejected) {
    config.method = types::DescriptorMethod::Histogram;
    const auto first = describe(support::ramp());
    const auto second = describe(support::squareOnDark());

    EXPECT_THROW((void) comparator.compare(first, second), types::ConfigurationMismatchError);
}
