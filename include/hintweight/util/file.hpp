#pragma once

#include "hintweight/core/error.hpp"

#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

namespace hintweight::util {

/// Read entire file into a string.
[[nodiscard]] inline auto read_file(std::string_view path)
    -> Result<std::string> {
  std::ifstream in(std::string(path), std::ios::binary);
  if (!in) {
    return fail(Error::FileNotFound);
  }
  return ok(std::string((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>()));
}

/// Replace the file's contents; false when it cannot be opened for writing.
[[nodiscard]] inline auto write_file(std::string_view path,
                                     std::string_view content) -> bool {
  std::ofstream out(std::string(path), std::ios::binary | std::ios::trunc);
  if (!out) {
    return false;
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  return static_cast<bool>(out);
}

} // namespace hintweight::util
