// File: tests/config/settings_test.cpp

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "config/configuration.hpp"
#include "config/settings.hpp"
#include "support/synthetic_images.hpp"

using config::Configuration;
using config::Settings;
using ::testing::ElementsAre;

TEST(ConfigurationTest, FlattensNestedKeys) {
    const auto configuration = Configuration::fromString(R"(
descriptor:
  hash_size: 16
  nested:
    deeper: true
report:
  format: json
)");

    EXPECT_THAT(configuration.keys(),
                ElementsAre("descriptor.hash_size", "descriptor.nested.deeper", "report.format"));
    EXPECT_EQ(configuration.get<int>("descriptor.hash_size").value_or(0), 16);
    EXPECT_TRUE(configuration.get<bool>("descriptor.nested.deeper", false));
    EXPECT_EQ(configuration.get("report.format", "lines"), "json");
    EXPECT_EQ(configuration.get("report.missing", "fallback"), "fallback");
    EXPECT_FALSE(configuration.get<int>("report.missing").has_value());
}

TEST(ConfigurationTest, WrongTypeIsInvalidArgument) {
    const auto configuration = Configuration::fromString("descriptor:\n  hash_size: large\n");
    EXPECT_THROW((void) configuration.get<int>("descriptor.hash_size"), std::invalid_argument);
}

TEST(ConfigurationTest, UnreadableFilesAreRuntimeErrors) {
    EXPECT_THROW(Configuration("/nonexistent/configuration.yaml"), std::runtime_error);
    EXPECT_THROW((void) Configuration::fromString("[unbalanced"), std::runtime_error);
}

TEST(ConfigurationTest, LoadsFromFile) {
    const tests::support::TemporaryDirectory directory;
    const auto file = directory.writeText("configuration.yaml", "batch:\n  concurrency: 3\n");

    const Configuration configuration(file.string());
    EXPECT_EQ(configuration.get<unsigned int>("batch.concurrency").value_or(0), 3u);
    EXPECT_EQ(configuration.filename(), file.string());
}

TEST(SettingsTest, DefaultsAreValid) {
    const Settings settings;
    EXPECT_NO_THROW(settings.validate());
    EXPECT_EQ(settings.descriptor.method, types::DescriptorMethod::Composite);
    EXPECT_EQ(settings.report_format, "lines");
    EXPECT_EQ(settings.log_level, "warn");
    EXPECT_THAT(settings.extensions, ElementsAre("png", "jpg", "jpeg"));
    EXPECT_TRUE(settings.recursive);
}

TEST(SettingsTest, ReadsEveryKey) {
    const auto settings = Settings::fromConfiguration(Configuration::fromString(R"(
descriptor:
  method: PHash
  hash_size: 64
  dct_size: 16
  histogram_bins: 16
  hash_weight: 0.75
batch:
  concurrency: 2
  recursive: false
  extensions: [".PNG", "tiff", "png"]
report:
  format: table
  precision: 3
logging:
  level: debug
  file: logs/run.log
)"));

    EXPECT_EQ(settings.descriptor.method, types::DescriptorMethod::PerceptualHash);
    EXPECT_EQ(settings.descriptor.hash_size, 64);
    EXPECT_EQ(settings.descriptor.dct_size, 16);
    EXPECT_EQ(settings.descriptor.histogram_bins, 16);
    EXPECT_DOUBLE_EQ(settings.descriptor.hash_weight, 0.75);
    EXPECT_EQ(settings.concurrency, 2u);
    EXPECT_FALSE(settings.recursive);
    EXPECT_THAT(settings.extensions, ElementsAre("png", "tiff"));
    EXPECT_EQ(settings.report_format, "table");
    EXPECT_EQ(settings.report_precision, 3);
    EXPECT_EQ(settings.log_level, "debug");
    EXPECT_EQ(settings.log_file, "logs/run.log");
}

TEST(SettingsTest, MissingKeysKeepDefaults) {
    const auto settings = Settings::fromConfiguration(Configuration::fromString("report:\n  precision: 4\n"));

    EXPECT_EQ(settings.report_precision, 4);
    EXPECT_EQ(settings.descriptor, types::DescriptorConfig{});
    EXPECT_EQ(settings.report_format, "lines");
}

TEST(SettingsTest, RejectsInvalidValues) {
    EXPECT_THROW((void) Settings::fromConfiguration(Configuration::fromString("descriptor:\n  method: sift\n")),
                 std::invalid_argument);
    EXPECT_THROW((void) Settings::fromConfiguration(Configuration::fromString("descriptor:\n  hash_size: 7\n")),
                 std::invalid_argument);
    EXPECT_THROW((void) Settings::fromConfiguration(Configuration::fromString("report:\n  format: xml\n")),
                 std::invalid_argument);
    EXPECT_THROW((void) Settings::fromConfiguration(Configuration::fromString("report:\n  precision: 0\n")),
                 std::invalid_argument);
    EXPECT_THROW((void) Settings::fromConfiguration(Configuration::fromString("logging:\n  level: loud\n")),
                 std::invalid_argument);
}

TEST(SettingsTest, ParsesExtensionLists) {
    EXPECT_THAT(config::parseExtensions(" .JPG, png ,,jpg"), ElementsAre("jpg", "png"));
    EXPECT_EQ(config::parseExtensions(""), Settings::defaultExtensions());
    EXPECT_EQ(config::parseExtensions(" , ."), Settings::defaultExtensions());
}
