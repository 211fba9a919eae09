#include "hintweight/extrinsic/extrinsic_config.hpp"

#include <algorithm>
#include <iterator>
#include <type_traits>
#include <utility>

namespace hintweight {
namespace {

[[nodiscard]] auto apply_curve(double bonus,
                               const std::optional<PartCurve> &curve,
                               std::optional<double> overlap_length) -> double {
  if (!curve || !overlap_length) {
    return bonus;
  }
  return *overlap_length >= curve->min_length ? curve->full_bonus : bonus;
}

} // namespace

auto ExtrinsicConfig::source_index(EvidenceSource source) const
    -> std::optional<std::size_t> {
  auto it = std::ranges::find(sources_, source);
  if (it == sources_.end()) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(std::distance(sources_.begin(), it));
}

auto ExtrinsicConfig::source_flags(EvidenceSource source) const
    -> std::span<const SourceFlag> {
  if (auto it = flags_.find(source); it != flags_.end()) {
    return it->second;
  }
  return {};
}

auto ExtrinsicConfig::has_flag(EvidenceSource source, SourceFlag flag) const
    -> bool {
  return std::ranges::contains(source_flags(source), flag);
}

auto ExtrinsicConfig::row(FeatureType type) const -> const FeatureWeightRow & {
  return rows_.at(std::to_underlying(type));
}

auto ExtrinsicConfig::lookup_bonus(FeatureType type, EvidenceSource source,
                                   std::optional<double> overlap_length) const
    -> Result<HintBonus> {
  auto idx = source_index(source);
  if (!idx) {
    return fail(Error::UnknownSource);
  }

  return std::visit(
      [&](const auto &r) -> Result<HintBonus> {
        const auto &entry = r.bonuses.at(*idx);
        if constexpr (std::is_same_v<std::decay_t<decltype(r)>,
                                     PartFeatureRow>) {
          return ok(HintBonus{
              .malus = entry.malus,
              .bonus = apply_curve(entry.bonus, entry.curve, overlap_length),
              .curve = entry.curve});
        } else {
          return ok(HintBonus{
              .malus = entry.malus, .bonus = entry.bonus, .curve = {}});
        }
      },
      row(type));
}

auto ExtrinsicConfig::lookup_bonus(std::string_view feature,
                                   std::string_view source,
                                   std::optional<double> overlap_length) const
    -> Result<HintBonus> {
  auto type = parse_feature_type(feature);
  if (!type) {
    return fail(Error::UnknownFeature);
  }
  auto src = parse<EvidenceSource>(source);
  if (!src) {
    return fail(Error::UnknownSource);
  }
  return lookup_bonus(*type, *src, overlap_length);
}

auto operator==(const ExtrinsicConfig &lhs, const ExtrinsicConfig &rhs)
    -> bool {
  if (lhs.sources_ != rhs.sources_ || lhs.group_label_ != rhs.group_label_ ||
      lhs.rows_ != rhs.rows_) {
    return false;
  }
  return std::ranges::all_of(lhs.sources_, [&](EvidenceSource s) {
    return std::ranges::equal(lhs.source_flags(s), rhs.source_flags(s));
  });
}

} // namespace hintweight
