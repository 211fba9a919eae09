#pragma once

#include "hintweight/extrinsic/config_error.hpp"
#include "hintweight/extrinsic/extrinsic_config.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace hintweight {

enum class Section : std::uint8_t { Sources, SourceParameters, Group, General };

inline constexpr std::array<std::string_view, 4> kSectionNames = {
    "SOURCES", "SOURCE-PARAMETERS", "GROUP", "GENERAL"};

/// Loads AUGUSTUS-style extrinsic hint configurations ([SOURCES],
/// [SOURCE-PARAMETERS], [GROUP], [GENERAL]). Validation is all-or-nothing:
/// the first problem found is returned and no partial config escapes.
class ExtrinsicConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> ConfigResult<ExtrinsicConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view text)
      -> ConfigResult<ExtrinsicConfig>;

  /// Canonical layout; load_from_string(to_string(c)) == c.
  [[nodiscard]] static auto to_string(const ExtrinsicConfig &config)
      -> std::string;

private:
  [[nodiscard]] static auto parse_text(std::string_view text)
      -> ConfigResult<ExtrinsicConfig>;
};

} // namespace hintweight
