#pragma once

#include "hintweight/core/error.hpp"
#include "hintweight/extrinsic/evidence_source.hpp"
#include "hintweight/extrinsic/feature_type.hpp"

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hintweight {

/// Leading tuning constants of a [GENERAL] row. `radius` is present exactly
/// when the feature's schema asks for two leading parameters.
struct RowParams {
  double slope{1.0};
  std::optional<double> radius;

  bool operator==(const RowParams &) const = default;
};

struct SourceBonus {
  double malus{1.0};
  double bonus{1.0};

  bool operator==(const SourceBonus &) const = default;
};

/// Minimum-fragment-length forgiveness for partial-overlap hints: a hint
/// overlapping at least `min_length` positions earns `full_bonus`.
struct PartCurve {
  double min_length{0.0};
  double full_bonus{1.0};

  bool operator==(const PartCurve &) const = default;
};

struct PartSourceBonus {
  double malus{1.0};
  double bonus{1.0};
  std::optional<PartCurve> curve;

  bool operator==(const PartSourceBonus &) const = default;
};

// Bonus vectors are parallel to ExtrinsicConfig::sources().

struct PointFeatureRow {
  FeatureType type{FeatureType::Start};
  bool exact_boundary{true};
  RowParams params;
  std::vector<SourceBonus> bonuses;

  bool operator==(const PointFeatureRow &) const = default;
};

struct SpanFeatureRow {
  FeatureType type{FeatureType::Exon};
  bool exact_boundary{true};
  RowParams params;
  std::vector<SourceBonus> bonuses;

  bool operator==(const SpanFeatureRow &) const = default;
};

struct PartFeatureRow {
  FeatureType type{FeatureType::ExonPart};
  bool exact_boundary{true};
  RowParams params;
  std::vector<PartSourceBonus> bonuses;

  bool operator==(const PartFeatureRow &) const = default;
};

using FeatureWeightRow =
    std::variant<PointFeatureRow, SpanFeatureRow, PartFeatureRow>;

[[nodiscard]] inline auto feature_of(const FeatureWeightRow &row)
    -> FeatureType {
  return std::visit([](const auto &r) { return r.type; }, row);
}

[[nodiscard]] inline auto exact_boundary_of(const FeatureWeightRow &row)
    -> bool {
  return std::visit([](const auto &r) { return r.exact_boundary; }, row);
}

[[nodiscard]] inline auto params_of(const FeatureWeightRow &row)
    -> const RowParams & {
  return std::visit([](const auto &r) -> const RowParams & { return r.params; },
                    row);
}

/// Result of a scorer lookup. `bonus` already reflects the overlap length
/// when one was supplied; `curve` is kept so callers can apply it themselves.
struct HintBonus {
  double malus{1.0};
  double bonus{1.0};
  std::optional<PartCurve> curve;

  bool operator==(const HintBonus &) const = default;
};

using SourceFlagTable =
    ankerl::unordered_dense::map<EvidenceSource, std::vector<SourceFlag>>;

/// Immutable, validated extrinsic hint configuration. Instances only come
/// out of ExtrinsicConfigLoader.
class ExtrinsicConfig {
public:
  [[nodiscard]] auto sources() const noexcept
      -> std::span<const EvidenceSource> {
    return sources_;
  }

  [[nodiscard]] auto source_index(EvidenceSource source) const
      -> std::optional<std::size_t>;
  [[nodiscard]] auto has_source(EvidenceSource source) const -> bool {
    return source_index(source).has_value();
  }

  /// Flags declared in [SOURCE-PARAMETERS], in declaration order; empty for
  /// sources that have none.
  [[nodiscard]] auto source_flags(EvidenceSource source) const
      -> std::span<const SourceFlag>;
  [[nodiscard]] auto has_flag(EvidenceSource source, SourceFlag flag) const
      -> bool;

  /// Empty when the file has no [GROUP] section.
  [[nodiscard]] auto group_label() const noexcept -> std::string_view {
    return group_label_;
  }

  [[nodiscard]] auto row(FeatureType type) const -> const FeatureWeightRow &;
  [[nodiscard]] auto rows() const noexcept
      -> std::span<const FeatureWeightRow> {
    return rows_;
  }

  [[nodiscard]] auto lookup_bonus(FeatureType type, EvidenceSource source,
                                  std::optional<double> overlap_length =
                                      std::nullopt) const -> Result<HintBonus>;
  [[nodiscard]] auto lookup_bonus(std::string_view feature,
                                  std::string_view source,
                                  std::optional<double> overlap_length =
                                      std::nullopt) const -> Result<HintBonus>;

  friend auto operator==(const ExtrinsicConfig &lhs,
                         const ExtrinsicConfig &rhs) -> bool;

private:
  friend class ExtrinsicConfigLoader;
  ExtrinsicConfig() = default;

  std::vector<EvidenceSource> sources_;
  SourceFlagTable flags_;
  std::string group_label_;
  // One row per FeatureType, indexed by its underlying value.
  std::vector<FeatureWeightRow> rows_;
};

} // namespace hintweight
