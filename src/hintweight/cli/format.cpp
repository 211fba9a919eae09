#include "hintweight/cli/commands.hpp"
#include "hintweight/extrinsic/config_loader.hpp"
#include "hintweight/util/file.hpp"
#include "hintweight/util/log.hpp"

#include <print>

namespace hintweight::cli {

auto cmd_format(const FormatOptions &opts) -> int {
  auto config = ExtrinsicConfigLoader::load_from_file(opts.file);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 1;
  }

  auto text = ExtrinsicConfigLoader::to_string(*config);
  if (!opts.output) {
    std::print("{}", text);
    return 0;
  }

  if (!util::write_file(*opts.output, text)) {
    log::error("cannot write {}", *opts.output);
    std::println(stderr, "Error: cannot write {}", *opts.output);
    return 1;
  }
  log::info("wrote canonical config to {}", *opts.output);
  return 0;
}

} // namespace hintweight::cli
