#include "hintweight/cli/commands.hpp"
#include "hintweight/cli/formatting.hpp"
#include "hintweight/extrinsic/config_loader.hpp"
#include "hintweight/util/json.hpp"

#include <cstddef>
#include <optional>
#include <print>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace hintweight::cli {

namespace {

struct SourceView {
  std::string code;
  std::string description;
  std::vector<std::string> flags;
};

struct BonusView {
  std::string source;
  double malus{1.0};
  double bonus{1.0};
  std::optional<double> min_length;
  std::optional<double> full_bonus;
};

struct RowView {
  std::string feature;
  std::string category;
  bool exact_boundary{true};
  double slope{1.0};
  std::optional<double> radius;
  std::vector<BonusView> bonuses;
};

struct ConfigView {
  std::string file;
  std::string group;
  std::vector<SourceView> sources;
  std::vector<RowView> rows;
};

auto make_view(const std::string &file, const ExtrinsicConfig &config)
    -> ConfigView {
  ConfigView view{.file = file,
                  .group = std::string(config.group_label()),
                  .sources = {},
                  .rows = {}};

  for (auto source : config.sources()) {
    SourceView sv{.code = std::string(to_string_view(source)),
                  .description = std::string(describe(source)),
                  .flags = {}};
    for (auto flag : config.source_flags(source)) {
      sv.flags.emplace_back(to_string_view(flag));
    }
    view.sources.push_back(std::move(sv));
  }

  for (const auto &row : config.rows()) {
    auto type = feature_of(row);
    const auto &params = params_of(row);
    RowView rv{.feature = std::string(to_string_view(type)),
               .category = std::string(to_string_view(category(type))),
               .exact_boundary = exact_boundary_of(row),
               .slope = params.slope,
               .radius = params.radius,
               .bonuses = {}};
    std::visit(
        [&](const auto &r) {
          for (std::size_t i = 0; i < r.bonuses.size(); ++i) {
            const auto &b = r.bonuses[i];
            BonusView bv{
                .source = std::string(to_string_view(config.sources()[i])),
                .malus = b.malus,
                .bonus = b.bonus,
                .min_length = {},
                .full_bonus = {}};
            if constexpr (std::is_same_v<std::decay_t<decltype(r)>,
                                         PartFeatureRow>) {
              if (b.curve) {
                bv.min_length = b.curve->min_length;
                bv.full_bonus = b.curve->full_bonus;
              }
            }
            rv.bonuses.push_back(std::move(bv));
          }
        },
        row);
    view.rows.push_back(std::move(rv));
  }
  return view;
}

auto print_view(const ConfigView &view) -> void {
  std::println("{} {}", fmt::ansi::bold("Config:"), view.file);
  std::println("{} {}", fmt::ansi::bold("Group: "),
               view.group.empty() ? fmt::ansi::dim("(none)") : view.group);
  std::println("");

  fmt::Table sources({{"SOURCE"}, {"DESCRIPTION"}, {"FLAGS"}});
  for (const auto &s : view.sources) {
    std::string flags;
    for (const auto &f : s.flags) {
      if (!flags.empty())
        flags += ',';
      flags += f;
    }
    sources.add_row({fmt::ansi::cyan(s.code), s.description,
                     flags.empty() ? fmt::ansi::dim("-") : flags});
  }
  std::println("{}", sources.render());

  std::vector<fmt::Table::Column> columns{
      {"FEATURE"}, {"KIND"}, {"EXACT"}, {"PARAMS"}};
  for (const auto &s : view.sources) {
    columns.push_back({.header = s.code, .right_align = true});
  }
  fmt::Table rows(std::move(columns));
  for (const auto &r : view.rows) {
    std::vector<std::string> cells{
        r.feature, r.category, r.exact_boundary ? "1" : "0",
        fmt::format_params(RowParams{.slope = r.slope, .radius = r.radius})};
    for (const auto &b : r.bonuses) {
      std::optional<PartCurve> curve;
      if (b.min_length && b.full_bonus) {
        curve = PartCurve{.min_length = *b.min_length,
                          .full_bonus = *b.full_bonus};
      }
      cells.push_back(fmt::format_bonus(b.malus, b.bonus, curve));
    }
    rows.add_row(std::move(cells));
  }
  std::print("{}", rows.render());
}

} // namespace

auto cmd_show(const ShowOptions &opts) -> int {
  auto res = ExtrinsicConfigLoader::load_from_file(opts.file);
  if (!res) {
    std::println(stderr, "Error: {}", res.error().message());
    return 1;
  }

  auto view = make_view(opts.file, *res);
  if (opts.json) {
    std::println("{}", dump_json_pretty(view));
  } else {
    print_view(view);
  }
  return 0;
}

} // namespace hintweight::cli
