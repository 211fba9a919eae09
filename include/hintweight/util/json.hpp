#pragma once

#include <glaze/json.hpp>

#include <string>

namespace hintweight {

/// Serialize any glaze-described value; "null" when glaze reports an error.
template <typename T>
[[nodiscard]] auto dump_json(const T &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

template <typename T>
[[nodiscard]] auto dump_json_pretty(const T &value) -> std::string {
  auto out = glz::write<glz::opts{.prettify = true}>(value);
  return out ? *out : "null";
}

} // namespace hintweight
