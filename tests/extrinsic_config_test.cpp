#include "hintweight/extrinsic/config_loader.hpp"
#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <algorithm>
#include <variant>
#include <vector>

using namespace hintweight;

namespace {

auto load_etm2() -> ExtrinsicConfig {
  auto result = ExtrinsicConfigLoader::load_from_string(test::kEtm2Config);
  EXPECT_TRUE(result.has_value()) << result.error().message();
  // Throws std::bad_expected_access on failure, which gtest reports.
  return std::move(result).value();
}

} // namespace

TEST(ExtrinsicConfigTest, Etm2SourcesFlagsAndGroup) {
  auto config = load_etm2();

  std::vector<EvidenceSource> expected{EvidenceSource::M, EvidenceSource::RM,
                                       EvidenceSource::E, EvidenceSource::W,
                                       EvidenceSource::T};
  EXPECT_TRUE(std::ranges::equal(config.sources(), expected));
  EXPECT_EQ(config.source_index(EvidenceSource::W).value_or(99), 3u);
  EXPECT_FALSE(config.has_source(EvidenceSource::P));

  EXPECT_EQ(config.group_label(), "ComparativeAnnotationToolkit");

  auto t_flags = config.source_flags(EvidenceSource::T);
  ASSERT_EQ(t_flags.size(), 1u);
  EXPECT_EQ(t_flags[0], SourceFlag::IndividualLiability);
  EXPECT_TRUE(
      config.has_flag(EvidenceSource::T, SourceFlag::IndividualLiability));
  EXPECT_FALSE(
      config.has_flag(EvidenceSource::T, SourceFlag::OneGroupOneGene));
  EXPECT_TRUE(config.source_flags(EvidenceSource::M).empty());
  EXPECT_TRUE(config.source_flags(EvidenceSource::P).empty());
}

TEST(ExtrinsicConfigTest, EveryRowCoversEverySourceInOrder) {
  auto config = load_etm2();
  ASSERT_EQ(config.rows().size(), kFeatureTypeCount);

  for (auto type : all_feature_types()) {
    const auto &row = config.row(type);
    EXPECT_EQ(feature_of(row), type);
    std::visit(
        [&](const auto &r) {
          EXPECT_EQ(r.bonuses.size(), config.sources().size())
              << to_string_view(type);
        },
        row);
  }
}

TEST(ExtrinsicConfigTest, RowVariantFollowsFeatureCategory) {
  auto config = load_etm2();

  EXPECT_TRUE(
      std::holds_alternative<PointFeatureRow>(config.row(FeatureType::Start)));
  EXPECT_TRUE(
      std::holds_alternative<PointFeatureRow>(config.row(FeatureType::Dss)));
  EXPECT_TRUE(
      std::holds_alternative<SpanFeatureRow>(config.row(FeatureType::Exon)));
  EXPECT_TRUE(std::holds_alternative<SpanFeatureRow>(
      config.row(FeatureType::NonExonPart)));
  EXPECT_TRUE(std::holds_alternative<PartFeatureRow>(
      config.row(FeatureType::ExonPart)));
  EXPECT_TRUE(std::holds_alternative<PartFeatureRow>(
      config.row(FeatureType::CdsPart)));
}

TEST(ExtrinsicConfigTest, LeadingParameters) {
  auto config = load_etm2();

  const auto &start = params_of(config.row(FeatureType::Start));
  EXPECT_DOUBLE_EQ(start.slope, 0.3);
  EXPECT_FALSE(start.radius.has_value());

  const auto &ass = params_of(config.row(FeatureType::Ass));
  EXPECT_DOUBLE_EQ(ass.slope, 1.0);
  ASSERT_TRUE(ass.radius.has_value());
  EXPECT_DOUBLE_EQ(*ass.radius, 0.1);

  const auto &exonpart = params_of(config.row(FeatureType::ExonPart));
  EXPECT_DOUBLE_EQ(exonpart.slope, 0.98);
  EXPECT_DOUBLE_EQ(exonpart.radius.value_or(0.0), 0.97);

  EXPECT_DOUBLE_EQ(params_of(config.row(FeatureType::Intron)).slope, 1e-3);
  EXPECT_TRUE(exact_boundary_of(config.row(FeatureType::Intron)));
}

TEST(ExtrinsicConfigTest, LookupPointAndSpanBonuses) {
  auto config = load_etm2();

  auto start = config.lookup_bonus(FeatureType::Start, EvidenceSource::T);
  ASSERT_TRUE(start.has_value());
  EXPECT_DOUBLE_EQ(start->malus, 1.0);
  EXPECT_DOUBLE_EQ(start->bonus, 1e10);
  EXPECT_FALSE(start->curve.has_value());

  auto anchor = config.lookup_bonus("start", "M");
  ASSERT_TRUE(anchor.has_value());
  EXPECT_DOUBLE_EQ(anchor->bonus, 1e100);

  auto intron = config.lookup_bonus("intron", "E");
  ASSERT_TRUE(intron.has_value());
  EXPECT_DOUBLE_EQ(intron->bonus, 1e6);

  auto repeats = config.lookup_bonus("nonexonpart", "RM");
  ASSERT_TRUE(repeats.has_value());
  EXPECT_DOUBLE_EQ(repeats->bonus, 1.15);

  // Tab-separated group in the CDSpart row.
  auto cds_w = config.lookup_bonus("CDSpart", "W");
  ASSERT_TRUE(cds_w.has_value());
  EXPECT_DOUBLE_EQ(cds_w->malus, 1.0);
  EXPECT_DOUBLE_EQ(cds_w->bonus, 1.0);
}

TEST(ExtrinsicConfigTest, LookupPartCurveUsesOverlapLength) {
  auto config = load_etm2();

  auto full = config.lookup_bonus("exonpart", "T", 12.0);
  ASSERT_TRUE(full.has_value());
  EXPECT_DOUBLE_EQ(full->malus, 2.0);
  EXPECT_DOUBLE_EQ(full->bonus, 1e10);
  ASSERT_TRUE(full->curve.has_value());
  EXPECT_DOUBLE_EQ(full->curve->min_length, 10.0);
  EXPECT_DOUBLE_EQ(full->curve->full_bonus, 1e10);

  auto short_hint = config.lookup_bonus("exonpart", "T", 3.0);
  ASSERT_TRUE(short_hint.has_value());
  EXPECT_DOUBLE_EQ(short_hint->bonus, 1.5);

  auto boundary = config.lookup_bonus("exonpart", "T", 10.0);
  ASSERT_TRUE(boundary.has_value());
  EXPECT_DOUBLE_EQ(boundary->bonus, 1e10);

  auto no_overlap = config.lookup_bonus("exonpart", "T");
  ASSERT_TRUE(no_overlap.has_value());
  EXPECT_DOUBLE_EQ(no_overlap->bonus, 1.5);
  EXPECT_TRUE(no_overlap->curve.has_value());

  auto utr = config.lookup_bonus("UTRpart", "T", 50.0);
  ASSERT_TRUE(utr.has_value());
  EXPECT_DOUBLE_EQ(utr->bonus, 1e30);
}

TEST(ExtrinsicConfigTest, OverlapIgnoredWithoutCurve) {
  auto config = load_etm2();

  auto w = config.lookup_bonus("exonpart", "W", 500.0);
  ASSERT_TRUE(w.has_value());
  EXPECT_DOUBLE_EQ(w->bonus, 1.005);
  EXPECT_FALSE(w->curve.has_value());

  auto span = config.lookup_bonus("exon", "T", 500.0);
  ASSERT_TRUE(span.has_value());
  EXPECT_DOUBLE_EQ(span->bonus, 1.0);
}

TEST(ExtrinsicConfigTest, LookupRejectsUnknownSourceOrFeature) {
  auto config = load_etm2();

  auto absent = config.lookup_bonus(FeatureType::Start, EvidenceSource::P);
  ASSERT_FALSE(absent.has_value());
  EXPECT_EQ(absent.error(), make_error_code(Error::UnknownSource));

  auto bogus_source = config.lookup_bonus("start", "X");
  ASSERT_FALSE(bogus_source.has_value());
  EXPECT_EQ(bogus_source.error(), make_error_code(Error::UnknownSource));

  auto lowercase = config.lookup_bonus("start", "t");
  ASSERT_FALSE(lowercase.has_value());
  EXPECT_EQ(lowercase.error(), make_error_code(Error::UnknownSource));

  auto bogus_feature = config.lookup_bonus("gene", "T");
  ASSERT_FALSE(bogus_feature.has_value());
  EXPECT_EQ(bogus_feature.error(), make_error_code(Error::UnknownFeature));

  auto wrong_case = config.lookup_bonus("cdspart", "T");
  ASSERT_FALSE(wrong_case.has_value());
  EXPECT_EQ(wrong_case.error(), make_error_code(Error::UnknownFeature));
}

TEST(ExtrinsicConfigTest, EqualityComparesContent) {
  auto a = load_etm2();
  auto b = load_etm2();
  EXPECT_TRUE(a == b);

  auto other = ExtrinsicConfigLoader::load_from_string(
      test::make_two_source_config());
  ASSERT_TRUE(other.has_value());
  EXPECT_FALSE(a == *other);
}
