#pragma once

#include "hintweight/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace hintweight {

// Enumerator names are the codes written in [SOURCES].
enum class EvidenceSource : std::uint8_t {
  M,  // manual anchor
  P,  // protein database hit
  E,  // EST/cDNA database hit
  C,  // combined EST/protein database hit
  D,  // Dialign
  R,  // retroposed genes
  T,  // transMapped RefSeqs
  W,  // wiggle track coverage from RNA-Seq
  RM, // RepeatMasker
};
BOOST_DESCRIBE_ENUM(EvidenceSource, M, P, E, C, D, R, T, W, RM)
HINTWEIGHT_DEFINE_ENUM_SERDE(EvidenceSource)

inline constexpr std::size_t kEvidenceSourceCount =
    util::enum_count<EvidenceSource>();

inline constexpr std::array<std::string_view, kEvidenceSourceCount>
    kEvidenceSourceDescriptions = {
        "manual anchor",
        "protein database hit",
        "EST/cDNA database hit",
        "combined EST/protein database hit",
        "Dialign",
        "retroposed genes",
        "transMapped RefSeqs",
        "wiggle track coverage info from RNA-Seq",
        "RepeatMasker",
};

[[nodiscard]] inline auto describe(EvidenceSource source) -> std::string_view {
  return kEvidenceSourceDescriptions.at(std::to_underlying(source));
}

enum class SourceFlag : std::uint8_t {
  // Only unsatisfiable hints are disregarded instead of the whole group.
  IndividualLiability,
  // Try to predict a single gene covering all hints of a group.
  OneGroupOneGene,
};

inline constexpr std::array<std::string_view, 2> kSourceFlagNames = {
    "individual_liability", "1group1gene"};

[[nodiscard]] inline auto to_string_view(SourceFlag flag) -> std::string_view {
  return kSourceFlagNames.at(std::to_underlying(flag));
}

[[nodiscard]] inline auto parse_source_flag(std::string_view token)
    -> std::optional<SourceFlag> {
  for (std::size_t i = 0; i < kSourceFlagNames.size(); ++i) {
    if (kSourceFlagNames[i] == token) {
      return static_cast<SourceFlag>(i);
    }
  }
  return std::nullopt;
}

} // namespace hintweight
