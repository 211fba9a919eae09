#pragma once

#include <optional>
#include <string>
#include <vector>

namespace hintweight::cli {

struct ValidateOptions {
  std::vector<std::string> files;
  bool json{false};
};

struct ShowOptions {
  std::string file;
  bool json{false};
};

struct LookupOptions {
  std::string file;
  std::string feature;
  std::string source;
  std::optional<double> overlap; // Partial-overlap length for *part features
  bool json{false};
};

struct FormatOptions {
  std::string file;
  std::optional<std::string> output; // stdout when unset
};

[[nodiscard]] auto cmd_validate(const ValidateOptions &opts) -> int;
[[nodiscard]] auto cmd_show(const ShowOptions &opts) -> int;
[[nodiscard]] auto cmd_lookup(const LookupOptions &opts) -> int;
[[nodiscard]] auto cmd_format(const FormatOptions &opts) -> int;

} // namespace hintweight::cli
