#include "hintweight/cli/commands.hpp"
#include "hintweight/cli/formatting.hpp"
#include "hintweight/extrinsic/config_loader.hpp"
#include "hintweight/util/json.hpp"
#include "hintweight/util/log.hpp"

#include <optional>
#include <print>
#include <string>

namespace hintweight::cli {

namespace {

struct LookupReport {
  std::string feature;
  std::string source;
  std::optional<double> overlap;
  double malus{1.0};
  double bonus{1.0};
  std::optional<double> min_length;
  std::optional<double> full_bonus;
};

} // namespace

auto cmd_lookup(const LookupOptions &opts) -> int {
  auto config = ExtrinsicConfigLoader::load_from_file(opts.file);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 1;
  }

  auto hit = config->lookup_bonus(opts.feature, opts.source, opts.overlap);
  if (!hit) {
    std::println(stderr, "Error: {} ({} / {})", hit.error().message(),
                 opts.feature, opts.source);
    return 1;
  }
  log::debug("lookup {} {} -> malus={} bonus={}", opts.feature, opts.source,
             hit->malus, hit->bonus);

  LookupReport report{.feature = opts.feature,
                      .source = opts.source,
                      .overlap = opts.overlap,
                      .malus = hit->malus,
                      .bonus = hit->bonus,
                      .min_length = {},
                      .full_bonus = {}};
  if (hit->curve) {
    report.min_length = hit->curve->min_length;
    report.full_bonus = hit->curve->full_bonus;
  }

  if (opts.json) {
    std::println("{}", dump_json(report));
    return 0;
  }

  std::println("{} {} / {}", fmt::ansi::bold("Hint:"), report.feature,
               fmt::ansi::cyan(report.source));
  std::println("  malus: {}", util::format_number(report.malus));
  std::println("  bonus: {}", util::format_number(report.bonus));
  if (hit->curve) {
    std::println("  curve: full bonus {} from {} overlapping positions",
                 util::format_number(hit->curve->full_bonus),
                 util::format_number(hit->curve->min_length));
  }
  return 0;
}

} // namespace hintweight::cli
