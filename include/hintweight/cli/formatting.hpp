#pragma once

#include "hintweight/extrinsic/extrinsic_config.hpp"
#include "hintweight/util/conv.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <unistd.h>
#include <utility>
#include <vector>

namespace hintweight::cli::fmt {

namespace ansi {

inline constexpr std::string_view kReset = "\033[0m";
inline constexpr std::string_view kBold = "\033[1m";
inline constexpr std::string_view kDim = "\033[2m";
inline constexpr std::string_view kGreen = "\033[32m";
inline constexpr std::string_view kRed = "\033[31m";
inline constexpr std::string_view kCyan = "\033[36m";

// Colour only when stdout is a terminal; checked once per process.
inline auto enabled() noexcept -> bool {
  static const bool tty = ::isatty(::fileno(stdout)) != 0;
  return tty;
}

inline auto paint(std::string_view text, std::string_view style)
    -> std::string {
  return enabled() ? std::format("{}{}{}", style, text, kReset)
                   : std::string(text);
}

inline auto bold(std::string_view text) -> std::string {
  return paint(text, kBold);
}
inline auto dim(std::string_view text) -> std::string {
  return paint(text, kDim);
}
inline auto green(std::string_view text) -> std::string {
  return paint(text, kGreen);
}
inline auto red(std::string_view text) -> std::string {
  return paint(text, kRed);
}
inline auto cyan(std::string_view text) -> std::string {
  return paint(text, kCyan);
}

/// Printed width of `text` once SGR sequences (ESC ... m) are removed.
inline auto visible_width(std::string_view text) -> std::size_t {
  std::size_t width = 0;
  while (!text.empty()) {
    auto esc = text.find('\033');
    if (esc == std::string_view::npos) {
      return width + text.size();
    }
    width += esc;
    auto end = text.find('m', esc);
    if (end == std::string_view::npos) {
      return width;
    }
    text.remove_prefix(end + 1);
  }
  return width;
}

} // namespace ansi

/// Column-aligned text table; each column is as wide as its widest cell.
class Table {
public:
  struct Column {
    std::string header;
    bool right_align{false};
  };

  explicit Table(std::vector<Column> columns) : columns_(std::move(columns)) {}

  auto add_row(std::vector<std::string> cells) -> void {
    cells.resize(columns_.size());
    rows_.push_back(std::move(cells));
  }

  [[nodiscard]] auto render() const -> std::string {
    std::vector<std::size_t> widths;
    widths.reserve(columns_.size());
    for (const auto &col : columns_) {
      widths.push_back(col.header.size());
    }
    for (const auto &row : rows_) {
      for (std::size_t i = 0; i < row.size(); ++i) {
        widths[i] = std::max(widths[i], ansi::visible_width(row[i]));
      }
    }

    std::string out;
    std::vector<std::string> headers;
    headers.reserve(columns_.size());
    for (const auto &col : columns_) {
      headers.push_back(col.header);
    }
    append_line(out, headers, widths);

    std::size_t rule = widths.empty() ? 0 : widths.size() - 1;
    for (auto w : widths) {
      rule += w;
    }
    out.append(rule, '-');
    out += '\n';

    for (const auto &row : rows_) {
      append_line(out, row, widths);
    }
    return out;
  }

private:
  auto append_line(std::string &out, const std::vector<std::string> &cells,
                   const std::vector<std::size_t> &widths) const -> void {
    std::string line;
    for (std::size_t i = 0; i < cells.size(); ++i) {
      if (i > 0) {
        line += ' ';
      }
      std::string pad(widths[i] - ansi::visible_width(cells[i]), ' ');
      if (columns_[i].right_align) {
        line += pad + cells[i];
      } else {
        line += cells[i] + pad;
      }
    }
    // No trailing blanks after a left-aligned last column.
    while (line.ends_with(' ')) {
      line.pop_back();
    }
    out += line;
    out += '\n';
  }

  std::vector<Column> columns_;
  std::vector<std::vector<std::string>> rows_;
};

// "malus/bonus", plus " @min_length:full_bonus" when a curve is present.
inline auto format_bonus(double malus, double bonus,
                         const std::optional<PartCurve> &curve = std::nullopt)
    -> std::string {
  auto text = std::format("{}/{}", util::format_number(malus),
                          util::format_number(bonus));
  if (curve) {
    text += std::format(" @{}:{}", util::format_number(curve->min_length),
                        util::format_number(curve->full_bonus));
  }
  return text;
}

inline auto format_params(const RowParams &params) -> std::string {
  if (params.radius) {
    return std::format("{} {}", util::format_number(params.slope),
                       util::format_number(*params.radius));
  }
  return util::format_number(params.slope);
}

} // namespace hintweight::cli::fmt
