#include "hintweight/extrinsic/config_loader.hpp"

#include "hintweight/util/conv.hpp"
#include "hintweight/util/file.hpp"
#include "hintweight/util/log.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <exception>
#include <format>
#include <iterator>
#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace hintweight {
namespace {

struct Line {
  std::size_t number{0};
  std::string text;
};

struct SectionBlock {
  std::size_t header_line{0};
  std::vector<Line> lines;
};

using Sections = std::array<std::optional<SectionBlock>, kSectionNames.size()>;

[[nodiscard]] auto section_block(const Sections &sections, Section s)
    -> const std::optional<SectionBlock> & {
  return sections[std::to_underlying(s)];
}

[[nodiscard]] auto tokenize(const std::string &text)
    -> std::vector<std::string> {
  std::vector<std::string> tokens;
  boost::algorithm::split(tokens, text,
                          boost::algorithm::is_any_of(" \t\r\f\v"),
                          boost::algorithm::token_compress_on);
  std::erase_if(tokens, [](const std::string &t) { return t.empty(); });
  return tokens;
}

// Source codes start with a letter. Spellings of inf and nan also do; those
// are numbers, rejected later as non-finite.
[[nodiscard]] auto is_source_token(std::string_view token) -> bool {
  if (token.empty() ||
      std::isalpha(static_cast<unsigned char>(token.front())) == 0) {
    return false;
  }
  double value{};
  const auto *end = token.data() + token.size();
  auto [ptr, ec] = std::from_chars(token.data(), end, value);
  return ec != std::errc{} || ptr != end;
}

/// Trimmed lines with comments and blanks removed, numbered from 1.
[[nodiscard]] auto significant_lines(std::string_view text)
    -> std::vector<Line> {
  std::vector<Line> lines;
  std::size_t number = 0;
  for (auto chunk : text | std::views::split('\n')) {
    ++number;
    auto trimmed = boost::trim_copy(std::string(std::string_view(chunk)));
    if (trimmed.empty() || trimmed.starts_with('#')) {
      continue;
    }
    lines.push_back(Line{.number = number, .text = std::move(trimmed)});
  }
  return lines;
}

[[nodiscard]] auto section_of_header(std::string_view header)
    -> std::optional<Section> {
  if (header.size() < 2 || !header.ends_with(']')) {
    return std::nullopt;
  }
  auto name =
      boost::trim_copy(std::string(header.substr(1, header.size() - 2)));
  for (std::size_t i = 0; i < kSectionNames.size(); ++i) {
    if (kSectionNames[i] == name) {
      return static_cast<Section>(i);
    }
  }
  return std::nullopt;
}

[[nodiscard]] auto split_sections(std::vector<Line> lines)
    -> ConfigResult<Sections> {
  Sections sections;
  std::optional<Section> current;

  for (auto &line : lines) {
    if (line.text.starts_with('[')) {
      auto section = section_of_header(line.text);
      if (!section) {
        return reject(Error::MalformedHeader, line.number, line.text);
      }
      auto &slot = sections[std::to_underlying(*section)];
      if (slot) {
        return reject(Error::DuplicateSection, line.number, line.text);
      }
      slot = SectionBlock{.header_line = line.number, .lines = {}};
      current = section;
      continue;
    }
    if (!current) {
      return reject(Error::UnexpectedContent, line.number, line.text);
    }
    sections[std::to_underlying(*current)]->lines.push_back(std::move(line));
  }

  return sections;
}

[[nodiscard]] auto parse_sources(const std::optional<SectionBlock> &block)
    -> ConfigResult<std::vector<EvidenceSource>> {
  // An empty [SOURCES] is treated like a missing one.
  if (!block || block->lines.empty()) {
    return reject(Error::MissingRequiredSection,
                  block ? block->header_line : 0, "[SOURCES]");
  }

  std::vector<EvidenceSource> sources;
  for (const auto &line : block->lines) {
    for (const auto &token : tokenize(line.text)) {
      auto source = parse<EvidenceSource>(token);
      if (!source) {
        return reject(Error::UnknownSource, line.number, token);
      }
      if (std::ranges::contains(sources, *source)) {
        return reject(Error::DuplicateSource, line.number, token);
      }
      sources.push_back(*source);
    }
  }
  return sources;
}

[[nodiscard]] auto
parse_source_parameters(const std::optional<SectionBlock> &block,
                        std::span<const EvidenceSource> sources)
    -> ConfigResult<SourceFlagTable> {
  SourceFlagTable table;
  if (!block) {
    return table;
  }

  for (const auto &line : block->lines) {
    auto tokens = tokenize(line.text);
    auto source = parse<EvidenceSource>(tokens.front());
    if (!source || !std::ranges::contains(sources, *source)) {
      return reject(Error::UnknownSource, line.number, tokens.front());
    }

    std::vector<SourceFlag> flags;
    for (const auto &token : tokens | std::views::drop(1)) {
      auto flag = parse_source_flag(token);
      if (!flag) {
        return reject(Error::UnknownFlag, line.number, token);
      }
      flags.push_back(*flag);
    }
    if (flags.empty()) {
      continue;
    }

    auto &merged = table[*source];
    for (auto flag : flags) {
      if (!std::ranges::contains(merged, flag)) {
        merged.push_back(flag);
      }
    }
  }

  return table;
}

[[nodiscard]] auto parse_group(const std::optional<SectionBlock> &block)
    -> ConfigResult<std::string> {
  if (!block) {
    return std::string{};
  }
  if (block->lines.empty()) {
    return reject(Error::EmptyGroupLabel, block->header_line, "[GROUP]");
  }
  if (block->lines.size() > 1) {
    const auto &extra = block->lines[1];
    return reject(Error::UnexpectedContent, extra.number, extra.text);
  }
  return block->lines.front().text;
}

struct SourceGroup {
  EvidenceSource source;
  std::vector<double> values;
};

[[nodiscard]] auto group_size_allowed(FeatureCategory category,
                                      std::size_t size) -> bool {
  return size == 2 || (category == FeatureCategory::Part && size == 4);
}

/// Consumes numeric tokens from `pos` up to the next source code.
[[nodiscard]] auto take_numbers(const std::vector<std::string> &tokens,
                                std::size_t &pos, std::size_t line)
    -> ConfigResult<std::vector<double>> {
  std::vector<double> values;
  while (pos < tokens.size() && !is_source_token(tokens[pos])) {
    auto value = util::parse_double(tokens[pos]);
    if (!value) {
      return reject(Error::InvalidNumber, line, tokens[pos]);
    }
    values.push_back(*value);
    ++pos;
  }
  return values;
}

[[nodiscard]] auto plain_bonuses(const std::vector<SourceGroup> &groups)
    -> std::vector<SourceBonus> {
  std::vector<SourceBonus> out;
  out.reserve(groups.size());
  for (const auto &g : groups) {
    out.push_back(SourceBonus{.malus = g.values[0], .bonus = g.values[1]});
  }
  return out;
}

[[nodiscard]] auto part_bonuses(const std::vector<SourceGroup> &groups)
    -> std::vector<PartSourceBonus> {
  std::vector<PartSourceBonus> out;
  out.reserve(groups.size());
  for (const auto &g : groups) {
    PartSourceBonus entry{
        .malus = g.values[0], .bonus = g.values[1], .curve = std::nullopt};
    if (g.values.size() == 4) {
      entry.curve = PartCurve{.min_length = g.values[2],
                              .full_bonus = g.values[3]};
    }
    out.push_back(entry);
  }
  return out;
}

[[nodiscard]] auto parse_row(FeatureType type,
                             const std::vector<std::string> &tokens,
                             std::size_t line,
                             std::span<const EvidenceSource> sources)
    -> ConfigResult<FeatureWeightRow> {
  const auto &layout = schema(type);
  if (tokens.size() < 2) {
    return reject(Error::ArityMismatch, line, tokens.front());
  }

  auto boundary = util::parse_int<int>(tokens[1]);
  if (!boundary || (*boundary != 0 && *boundary != 1)) {
    return reject(Error::InvalidNumber, line, tokens[1]);
  }

  std::size_t pos = 2;
  auto leading = take_numbers(tokens, pos, line);
  if (!leading) {
    return std::unexpected(std::move(leading.error()));
  }
  if (leading->size() != layout.leading_params) {
    return reject(Error::ArityMismatch, line, tokens.front());
  }

  std::vector<SourceGroup> groups;
  groups.reserve(sources.size());
  while (pos < tokens.size()) {
    const auto &code = tokens[pos];
    auto source = parse<EvidenceSource>(code);
    if (!source || !std::ranges::contains(sources, *source)) {
      return reject(Error::UnknownSource, line, code);
    }
    if (groups.size() == sources.size()) {
      return reject(Error::ArityMismatch, line, code);
    }
    if (*source != sources[groups.size()]) {
      return reject(Error::SourceOrderMismatch, line, code);
    }
    ++pos;

    auto values = take_numbers(tokens, pos, line);
    if (!values) {
      return std::unexpected(std::move(values.error()));
    }
    if (!group_size_allowed(layout.category, values->size())) {
      return reject(Error::ArityMismatch, line, code);
    }
    groups.push_back(
        SourceGroup{.source = *source, .values = std::move(*values)});
  }

  if (groups.size() < sources.size()) {
    return reject(Error::ArityMismatch, line,
                  to_string_view(sources[groups.size()]));
  }

  RowParams params{.slope = (*leading)[0], .radius = std::nullopt};
  if (leading->size() > 1) {
    params.radius = (*leading)[1];
  }
  const bool exact = *boundary == 1;

  switch (layout.category) {
  case FeatureCategory::Point:
    return PointFeatureRow{.type = type,
                           .exact_boundary = exact,
                           .params = params,
                           .bonuses = plain_bonuses(groups)};
  case FeatureCategory::Span:
    return SpanFeatureRow{.type = type,
                          .exact_boundary = exact,
                          .params = params,
                          .bonuses = plain_bonuses(groups)};
  case FeatureCategory::Part:
    return PartFeatureRow{.type = type,
                          .exact_boundary = exact,
                          .params = params,
                          .bonuses = part_bonuses(groups)};
  }
  std::unreachable();
}

[[nodiscard]] auto parse_general(const std::optional<SectionBlock> &block,
                                 std::span<const EvidenceSource> sources)
    -> ConfigResult<std::vector<FeatureWeightRow>> {
  if (!block) {
    return reject(Error::MissingRequiredSection, 0, "[GENERAL]");
  }

  std::vector<std::optional<FeatureWeightRow>> slots(kFeatureTypeCount);
  for (const auto &line : block->lines) {
    auto tokens = tokenize(line.text);
    auto type = parse_feature_type(tokens.front());
    if (!type) {
      return reject(Error::UnknownFeature, line.number, tokens.front());
    }
    auto &slot = slots[std::to_underlying(*type)];
    if (slot) {
      return reject(Error::DuplicateFeatureRow, line.number, tokens.front());
    }

    auto row = parse_row(*type, tokens, line.number, sources);
    if (!row) {
      return std::unexpected(std::move(row.error()));
    }
    slot = std::move(*row);
  }

  std::vector<FeatureWeightRow> rows;
  rows.reserve(kFeatureTypeCount);
  for (auto type : all_feature_types()) {
    auto &slot = slots[std::to_underlying(type)];
    if (!slot) {
      return reject(Error::MissingFeatureRow, 0, to_string_view(type));
    }
    rows.push_back(std::move(*slot));
  }
  return rows;
}

} // namespace

auto ExtrinsicConfigLoader::parse_text(std::string_view text)
    -> ConfigResult<ExtrinsicConfig> {
  auto sections = split_sections(significant_lines(text));
  if (!sections) {
    return std::unexpected(std::move(sections.error()));
  }

  auto sources = parse_sources(section_block(*sections, Section::Sources));
  if (!sources) {
    return std::unexpected(std::move(sources.error()));
  }
  auto flags = parse_source_parameters(
      section_block(*sections, Section::SourceParameters), *sources);
  if (!flags) {
    return std::unexpected(std::move(flags.error()));
  }

  auto group = parse_group(section_block(*sections, Section::Group));
  if (!group) {
    return std::unexpected(std::move(group.error()));
  }

  auto rows =
      parse_general(section_block(*sections, Section::General), *sources);
  if (!rows) {
    return std::unexpected(std::move(rows.error()));
  }

  ExtrinsicConfig config;
  config.sources_ = std::move(*sources);
  config.flags_ = std::move(*flags);
  config.group_label_ = std::move(*group);
  config.rows_ = std::move(*rows);
  return config;
}

auto ExtrinsicConfigLoader::load_from_file(std::string_view path)
    -> ConfigResult<ExtrinsicConfig> {
  auto text = util::read_file(path);
  if (!text) {
    log::error("Cannot read extrinsic config {}: {}", path,
               text.error().message());
    return reject(Error::FileNotFound, 0, path);
  }
  return load_from_string(*text);
}

auto ExtrinsicConfigLoader::load_from_string(std::string_view text)
    -> ConfigResult<ExtrinsicConfig> {
  try {
    auto result = parse_text(text);
    if (!result) {
      log::warn("Extrinsic config rejected: {}", result.error().message());
      return result;
    }
    log::debug("Loaded extrinsic config: {} source(s), group '{}'",
               result->sources().size(), result->group_label());
    return result;
  } catch (const std::exception &e) {
    log::error("Extrinsic config parse failed: {}", e.what());
    return reject(Error::ParseError, 0, e.what());
  }
}

auto ExtrinsicConfigLoader::to_string(const ExtrinsicConfig &config)
    -> std::string {
  std::string out;
  out.reserve(4096);

  out += "[SOURCES]\n";
  for (std::size_t i = 0; i < config.sources().size(); ++i) {
    if (i > 0) {
      out += ' ';
    }
    out += to_string_view(config.sources()[i]);
  }
  out += '\n';

  const bool any_flags = std::ranges::any_of(config.sources(), [&](auto s) {
    return !config.source_flags(s).empty();
  });
  if (any_flags) {
    out += "\n[SOURCE-PARAMETERS]\n";
    for (auto source : config.sources()) {
      auto flags = config.source_flags(source);
      if (flags.empty()) {
        continue;
      }
      out += to_string_view(source);
      for (auto flag : flags) {
        out += ' ';
        out += to_string_view(flag);
      }
      out += '\n';
    }
  }

  if (!config.group_label().empty()) {
    out += "\n[GROUP]\n";
    out += config.group_label();
    out += '\n';
  }

  out += "\n[GENERAL]\n";
  for (const auto &row : config.rows()) {
    std::visit(
        [&](const auto &r) {
          std::format_to(std::back_inserter(out), "{:>11} {} {}",
                         to_string_view(r.type), r.exact_boundary ? 1 : 0,
                         util::format_number(r.params.slope));
          if (r.params.radius) {
            std::format_to(std::back_inserter(out), " {}",
                           util::format_number(*r.params.radius));
          }
          for (std::size_t i = 0; i < r.bonuses.size(); ++i) {
            const auto &b = r.bonuses[i];
            std::format_to(std::back_inserter(out), "  {} {} {}",
                           to_string_view(config.sources()[i]),
                           util::format_number(b.malus),
                           util::format_number(b.bonus));
            if constexpr (std::is_same_v<std::decay_t<decltype(b)>,
                                         PartSourceBonus>) {
              if (b.curve) {
                std::format_to(std::back_inserter(out), " {} {}",
                               util::format_number(b.curve->min_length),
                               util::format_number(b.curve->full_bonus));
              }
            }
          }
          out += '\n';
        },
        row);
  }

  return out;
}

} // namespace hintweight
