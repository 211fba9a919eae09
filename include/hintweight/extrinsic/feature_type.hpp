#pragma once

#include "hintweight/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace hintweight {

enum class FeatureType : std::uint8_t {
  Start,
  Stop,
  Tss,
  Tts,
  Ass,
  Dss,
  ExonPart,
  Exon,
  IntronPart,
  Intron,
  CdsPart,
  Cds,
  UtrPart,
  Utr,
  IrPart,
  NonExonPart,
  GenicPart,
};
BOOST_DESCRIBE_ENUM(FeatureType, Start, Stop, Tss, Tts, Ass, Dss, ExonPart,
                    Exon, IntronPart, Intron, CdsPart, Cds, UtrPart, Utr,
                    IrPart, NonExonPart, GenicPart)

inline constexpr std::size_t kFeatureTypeCount =
    util::enum_count<FeatureType>();

enum class FeatureCategory : std::uint8_t {
  Point, // single-position features: start/stop codons, splice sites, tss/tts
  Span,  // whole intervals that must match exactly
  Part,  // partial-overlap features that may carry a length curve
};

struct FeatureSchema {
  std::string_view name;
  FeatureCategory category;
  std::uint8_t leading_params;
};

// Canonical schema, indexed by FeatureType.
inline constexpr std::array<FeatureSchema, kFeatureTypeCount> kFeatureSchema =
    {{
        {"start", FeatureCategory::Point, 1},
        {"stop", FeatureCategory::Point, 1},
        {"tss", FeatureCategory::Point, 1},
        {"tts", FeatureCategory::Point, 1},
        {"ass", FeatureCategory::Point, 2},
        {"dss", FeatureCategory::Point, 2},
        {"exonpart", FeatureCategory::Part, 2},
        {"exon", FeatureCategory::Span, 1},
        {"intronpart", FeatureCategory::Part, 1},
        {"intron", FeatureCategory::Span, 1},
        {"CDSpart", FeatureCategory::Part, 2},
        {"CDS", FeatureCategory::Span, 1},
        {"UTRpart", FeatureCategory::Part, 2},
        {"UTR", FeatureCategory::Span, 1},
        {"irpart", FeatureCategory::Span, 1},
        {"nonexonpart", FeatureCategory::Span, 1},
        {"genicpart", FeatureCategory::Span, 1},
    }};

[[nodiscard]] constexpr auto schema(FeatureType type) -> const FeatureSchema & {
  return kFeatureSchema[std::to_underlying(type)];
}

[[nodiscard]] constexpr auto to_string_view(FeatureType type)
    -> std::string_view {
  return schema(type).name;
}

[[nodiscard]] constexpr auto category(FeatureType type) -> FeatureCategory {
  return schema(type).category;
}

[[nodiscard]] constexpr auto parse_feature_type(std::string_view token)
    -> std::optional<FeatureType> {
  for (std::size_t i = 0; i < kFeatureSchema.size(); ++i) {
    if (kFeatureSchema[i].name == token) {
      return static_cast<FeatureType>(i);
    }
  }
  return std::nullopt;
}

[[nodiscard]] constexpr auto all_feature_types()
    -> std::array<FeatureType, kFeatureTypeCount> {
  std::array<FeatureType, kFeatureTypeCount> out{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<FeatureType>(i);
  }
  return out;
}

[[nodiscard]] inline auto to_string_view(FeatureCategory c)
    -> std::string_view {
  switch (c) {
  case FeatureCategory::Point:
    return "point";
  case FeatureCategory::Span:
    return "span";
  case FeatureCategory::Part:
    return "part";
  }
  std::unreachable();
}

} // namespace hintweight
