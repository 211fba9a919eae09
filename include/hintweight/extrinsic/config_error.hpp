#pragma once

#include "hintweight/core/error.hpp"
#include "hintweight/util/enum.hpp"

#include <cstddef>
#include <expected>
#include <format>
#include <string>
#include <string_view>
#include <system_error>

namespace hintweight {

/// A rejected extrinsic configuration. `line` is 1-based; 0 means the error
/// concerns the file as a whole (a missing section or row).
struct ConfigError {
  Error kind{Error::Unknown};
  std::size_t line{0};
  std::string token;

  [[nodiscard]] auto code() const -> std::error_code {
    return make_error_code(kind);
  }

  [[nodiscard]] auto kind_name() const -> std::string_view {
    return util::enum_to_snake_case_view(kind);
  }

  [[nodiscard]] auto message() const -> std::string {
    auto text = code().message();
    if (line > 0) {
      return token.empty() ? std::format("line {}: {}", line, text)
                           : std::format("line {}: {} near '{}'", line, text,
                                         token);
    }
    return token.empty() ? text : std::format("{}: '{}'", text, token);
  }

  bool operator==(const ConfigError &) const = default;
};

template <typename T> using ConfigResult = std::expected<T, ConfigError>;

[[nodiscard]] inline auto reject(Error kind, std::size_t line,
                                 std::string_view token)
    -> std::unexpected<ConfigError> {
  return std::unexpected{
      ConfigError{.kind = kind, .line = line, .token = std::string(token)}};
}

} // namespace hintweight
