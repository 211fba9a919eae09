#include "hintweight/util/log.hpp"

#include <csignal>
#include <gtest/gtest.h>

int main(int argc, char **argv) {
  std::signal(SIGPIPE, SIG_IGN);

  // Rejections are logged at warn; keep test output readable.
  hintweight::log::set_level(hintweight::log::Level::Off);

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
