#include "hintweight/extrinsic/config_loader.hpp"
#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <string>

using namespace hintweight;

namespace {

auto reload(const ExtrinsicConfig &config) -> ExtrinsicConfig {
  auto text = ExtrinsicConfigLoader::to_string(config);
  auto again = ExtrinsicConfigLoader::load_from_string(text);
  EXPECT_TRUE(again.has_value()) << again.error().message() << "\n" << text;
  return std::move(again).value();
}

} // namespace

TEST(ConfigWriterTest, Etm2SurvivesRoundTrip) {
  auto config = ExtrinsicConfigLoader::load_from_string(test::kEtm2Config);
  ASSERT_TRUE(config.has_value()) << config.error().message();

  auto again = reload(*config);
  EXPECT_TRUE(again == *config);

  auto hit = again.lookup_bonus("CDSpart", "T", 10.0);
  ASSERT_TRUE(hit.has_value());
  EXPECT_DOUBLE_EQ(hit->bonus, 1e20);
}

TEST(ConfigWriterTest, CanonicalTextIsStable) {
  auto config = ExtrinsicConfigLoader::load_from_string(test::kEtm2Config);
  ASSERT_TRUE(config.has_value());

  auto first = ExtrinsicConfigLoader::to_string(*config);
  auto second = ExtrinsicConfigLoader::to_string(reload(*config));
  EXPECT_EQ(first, second);
}

TEST(ConfigWriterTest, SectionLayout) {
  auto config = ExtrinsicConfigLoader::load_from_string(test::kEtm2Config);
  ASSERT_TRUE(config.has_value());
  auto text = ExtrinsicConfigLoader::to_string(*config);

  EXPECT_TRUE(text.starts_with("[SOURCES]\nM RM E W T\n"));
  EXPECT_NE(text.find("\n[SOURCE-PARAMETERS]\nT individual_liability\n"),
            std::string::npos);
  EXPECT_NE(text.find("\n[GROUP]\nComparativeAnnotationToolkit\n"),
            std::string::npos);
  EXPECT_LT(text.find("[GROUP]"), text.find("[GENERAL]"));
  EXPECT_NE(text.find("T 2 1.5 10 1e+10"), std::string::npos);
}

TEST(ConfigWriterTest, OptionalSectionsAreOmitted) {
  auto config =
      ExtrinsicConfigLoader::load_from_string(test::make_two_source_config());
  ASSERT_TRUE(config.has_value());
  auto text = ExtrinsicConfigLoader::to_string(*config);

  EXPECT_EQ(text.find("[SOURCE-PARAMETERS]"), std::string::npos);
  EXPECT_EQ(text.find("[GROUP]"), std::string::npos);
  EXPECT_TRUE(reload(*config) == *config);
}

TEST(ConfigWriterTest, FlagsAndGroupRoundTrip) {
  auto config = ExtrinsicConfigLoader::load_from_string(
      test::make_two_source_config(
          {.extra_sections = "[SOURCE-PARAMETERS]\n"
                             "M 1group1gene\n"
                             "T individual_liability 1group1gene\n\n"
                             "[GROUP]\nhuman chr21\n\n"}));
  ASSERT_TRUE(config.has_value()) << config.error().message();

  auto again = reload(*config);
  EXPECT_TRUE(again == *config);
  EXPECT_EQ(again.group_label(), "human chr21");
  EXPECT_EQ(again.source_flags(EvidenceSource::T).size(), 2u);
  EXPECT_TRUE(again.has_flag(EvidenceSource::M, SourceFlag::OneGroupOneGene));
}
