#include "hintweight/cli/commands.hpp"
#include "hintweight/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdio>
#include <cstdlib>
#include <print>
#include <string>

namespace {
auto default_log_level() -> std::string {
  if (const char *env = std::getenv("HINTWEIGHT_LOG_LEVEL"); env && *env) {
    return env;
  }
  return "error";
}
} // namespace

int main(int argc, char *argv[]) {
  hintweight::log::set_output_stderr();

  CLI::App app{"Validate and inspect AUGUSTUS extrinsic hint configurations",
               "hintweight"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  hintweight validate extrinsic.M.RM.E.W.cfg\n"
             "  hintweight lookup extrinsic.ETM2.cfg exonpart T --overlap 12\n"
             "\nTip: Set HINTWEIGHT_LOG_LEVEL=debug to trace loading.");

  std::string log_level = default_log_level();
  app.add_option("--log-level", log_level,
                 "Log level: trace|debug|info|warn|error|off")
      ->check(CLI::IsMember(
          {"trace", "debug", "info", "warn", "error", "off"}));
  std::string log_file;
  app.add_option("--log-file", log_file, "Append log lines to this file");
  auto apply_log_level = [&log_level, &log_file]() {
    hintweight::log::set_level(log_level);
    if (!log_file.empty() && !hintweight::log::set_output_file(log_file)) {
      std::println(stderr, "Warning: cannot open log file {}", log_file);
    }
  };

  hintweight::cli::ValidateOptions validate_opts;
  auto *validate =
      app.add_subcommand("validate", "Validate extrinsic config files");
  validate->footer("\nExamples:\n"
                   "  hintweight validate extrinsic.ETM2.cfg\n"
                   "  hintweight validate cfgs/*.cfg --json");
  validate->add_option("files", validate_opts.files, "Config files")
      ->required()
      ->check(CLI::ExistingFile);
  validate->add_flag("--json", validate_opts.json, "Output JSON");
  validate->callback([&validate_opts, &apply_log_level]() {
    apply_log_level();
    std::exit(hintweight::cli::cmd_validate(validate_opts));
  });

  hintweight::cli::ShowOptions show_opts;
  auto *show =
      app.add_subcommand("show", "Show sources, flags and the weight table");
  show->add_option("file", show_opts.file, "Config file")
      ->required()
      ->check(CLI::ExistingFile);
  show->add_flag("--json", show_opts.json, "Output JSON");
  show->callback([&show_opts, &apply_log_level]() {
    apply_log_level();
    std::exit(hintweight::cli::cmd_show(show_opts));
  });

  hintweight::cli::LookupOptions lookup_opts;
  auto *lookup = app.add_subcommand(
      "lookup", "Look up the malus/bonus of one feature and source");
  lookup->footer("\nExamples:\n"
                 "  hintweight lookup extrinsic.ETM2.cfg start T\n"
                 "  hintweight lookup extrinsic.ETM2.cfg exonpart T "
                 "--overlap 3 --json");
  lookup->add_option("file", lookup_opts.file, "Config file")
      ->required()
      ->check(CLI::ExistingFile);
  lookup->add_option("feature", lookup_opts.feature, "Feature type")
      ->required();
  lookup->add_option("source", lookup_opts.source, "Evidence source code")
      ->required();
  lookup
      ->add_option("--overlap", lookup_opts.overlap,
                   "Overlap length of a partial hint")
      ->check(CLI::NonNegativeNumber);
  lookup->add_flag("--json", lookup_opts.json, "Output JSON");
  lookup->callback([&lookup_opts, &apply_log_level]() {
    apply_log_level();
    std::exit(hintweight::cli::cmd_lookup(lookup_opts));
  });

  hintweight::cli::FormatOptions format_opts;
  auto *format =
      app.add_subcommand("format", "Rewrite a config in canonical layout");
  format->add_option("file", format_opts.file, "Config file")
      ->required()
      ->check(CLI::ExistingFile);
  format->add_option("-o,--output", format_opts.output,
                     "Output file (default: stdout)");
  format->callback([&format_opts, &apply_log_level]() {
    apply_log_level();
    std::exit(hintweight::cli::cmd_format(format_opts));
  });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
