#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <array>
#include <cstdio>
#include <string>

#ifndef HINTWEIGHT_BIN_PATH
#define HINTWEIGHT_BIN_PATH "hintweight"
#endif

namespace {

struct CmdResult {
  int exit_code{0};
  std::string output;
};

auto run_cmd(const std::string &cmd) -> CmdResult {
  CmdResult result;
  std::array<char, 256> buf{};
  std::string full = cmd + " 2>&1";
  FILE *pipe = ::popen(full.c_str(), "r");
  if (!pipe)
    return result;
  while (::fgets(buf.data(), buf.size(), pipe)) {
    result.output += buf.data();
  }
  result.exit_code = ::pclose(pipe);
  if (result.exit_code != 0)
    result.exit_code = 1;
  return result;
}

const std::string kBin = HINTWEIGHT_BIN_PATH;

} // namespace

TEST(CLIBinarySmokeTest, NoArgsShowsHelp) {
  auto r = run_cmd(kBin);
  EXPECT_NE(r.exit_code, 0);
  EXPECT_FALSE(r.output.empty());
}

TEST(CLIBinarySmokeTest, HelpListsSubcommands) {
  auto r = run_cmd(kBin + " --help");
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_NE(r.output.find("validate"), std::string::npos);
  EXPECT_NE(r.output.find("show"), std::string::npos);
  EXPECT_NE(r.output.find("lookup"), std::string::npos);
  EXPECT_NE(r.output.find("format"), std::string::npos);
}

TEST(CLIBinarySmokeTest, ValidateRequiresExistingFile) {
  auto r = run_cmd(kBin + " validate /nonexistent/hintweight/extrinsic.cfg");
  EXPECT_NE(r.exit_code, 0);
}

TEST(CLIBinarySmokeTest, ValidateSampleConfig) {
  hintweight::test::TempConfigFile cfg(hintweight::test::kEtm2Config);
  auto r = run_cmd(kBin + " validate --json " + cfg.path());
  EXPECT_EQ(r.exit_code, 0) << r.output;
  EXPECT_NE(r.output.find("\"valid\":true"), std::string::npos) << r.output;
}

TEST(CLIBinarySmokeTest, LookupWithOverlap) {
  hintweight::test::TempConfigFile cfg(hintweight::test::kEtm2Config);
  auto r = run_cmd(kBin + " lookup --json --overlap 3 " + cfg.path() +
                   " exonpart T");
  EXPECT_EQ(r.exit_code, 0) << r.output;
  EXPECT_NE(r.output.find("\"bonus\":1.5"), std::string::npos) << r.output;

  auto bad = run_cmd(kBin + " lookup " + cfg.path() + " start P");
  EXPECT_NE(bad.exit_code, 0);
}

TEST(CLIBinarySmokeTest, RejectsUnknownLogLevel) {
  hintweight::test::TempConfigFile cfg(hintweight::test::kEtm2Config);
  auto r = run_cmd(kBin + " --log-level loud validate " + cfg.path());
  EXPECT_NE(r.exit_code, 0);
}
