#pragma once

#include <boost/describe/enum.hpp>

#include <array>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace hintweight {

enum class Error : std::uint8_t {
  Success,
  FileNotFound,
  ParseError,
  MalformedHeader,
  DuplicateSection,
  UnexpectedContent,
  MissingRequiredSection,
  UnknownSource,
  DuplicateSource,
  UnknownFlag,
  UnknownFeature,
  InvalidNumber,
  ArityMismatch,
  SourceOrderMismatch,
  MissingFeatureRow,
  DuplicateFeatureRow,
  EmptyGroupLabel,
  Unknown,
};
BOOST_DESCRIBE_ENUM(Error, Success, FileNotFound, ParseError, MalformedHeader,
                    DuplicateSection, UnexpectedContent,
                    MissingRequiredSection, UnknownSource, DuplicateSource,
                    UnknownFlag, UnknownFeature, InvalidNumber, ArityMismatch,
                    SourceOrderMismatch, MissingFeatureRow,
                    DuplicateFeatureRow, EmptyGroupLabel, Unknown)

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 18> messages = {
      "success",
      "file not found",
      "parse error",
      "malformed section header",
      "section declared more than once",
      "content outside of any section",
      "required section missing or empty",
      "unknown evidence source",
      "evidence source declared more than once",
      "unknown source flag",
      "unknown feature type",
      "invalid numeric field",
      "wrong number of fields",
      "source groups out of [SOURCES] order",
      "feature row missing",
      "feature row declared more than once",
      "empty group label",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "hintweight";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      std::unreachable();
    }
    return std::string{messages.at(idx)};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

} // namespace hintweight

template <>
struct std::is_error_code_enum<hintweight::Error> : std::true_type {};
