#include "hintweight/cli/commands.hpp"
#include "hintweight/cli/formatting.hpp"
#include "hintweight/extrinsic/config_loader.hpp"
#include "hintweight/util/json.hpp"
#include "hintweight/util/log.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <print>
#include <string>
#include <vector>

namespace hintweight::cli {

namespace {

struct ValidationIssue {
  std::string kind;
  std::size_t line{0};
  std::string token;
  std::string message;
};

struct ValidationResult {
  std::string file;
  bool valid{false};
  std::size_t sources{0};
  std::optional<ValidationIssue> error;
};

struct ValidationSummary {
  std::size_t valid{0};
  std::size_t invalid{0};
  std::size_t total{0};
};

struct ValidationReport {
  std::vector<ValidationResult> results;
  ValidationSummary summary;
};

auto validate_single_file(const std::string &path) -> ValidationResult {
  ValidationResult vr{.file = path, .valid = false, .sources = 0, .error = {}};
  auto res = ExtrinsicConfigLoader::load_from_file(path);
  vr.valid = res.has_value();
  if (vr.valid) {
    vr.sources = res->sources().size();
  } else {
    const auto &err = res.error();
    vr.error = ValidationIssue{.kind = std::string(err.kind_name()),
                               .line = err.line,
                               .token = err.token,
                               .message = err.message()};
  }
  return vr;
}

} // namespace

auto cmd_validate(const ValidateOptions &opts) -> int {
  ValidationReport report;
  report.results.reserve(opts.files.size());
  for (const auto &file : opts.files) {
    auto &vr = report.results.emplace_back(validate_single_file(file));
    if (vr.valid) {
      ++report.summary.valid;
    } else {
      ++report.summary.invalid;
    }
  }
  report.summary.total = report.results.size();

  if (opts.json) {
    std::println("{}", dump_json(report));
  } else {
    for (const auto &vr : report.results) {
      auto name = std::filesystem::path(vr.file).filename().string();
      if (vr.valid) {
        std::println("{} {} - {} ({} sources)", fmt::ansi::green("✓"),
                     name, fmt::ansi::green("Valid"), vr.sources);
      } else {
        std::println("{} {} - {}", fmt::ansi::red("✗"), name,
                     fmt::ansi::red(vr.error->message));
      }
    }

    std::println("\nSummary: {} valid, {} invalid out of {} config files",
                 fmt::ansi::green(std::format("{}", report.summary.valid)),
                 report.summary.invalid > 0
                     ? fmt::ansi::red(
                           std::format("{}", report.summary.invalid))
                     : std::format("{}", report.summary.invalid),
                 report.summary.total);
  }

  log::debug("validated {} files, {} invalid", report.summary.total,
             report.summary.invalid);
  return report.summary.invalid > 0 ? 1 : 0;
}

} // namespace hintweight::cli
