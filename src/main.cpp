#include "codespaces/cli/commands.hpp"

#include <csignal>

int main(int argc, char **argv) {
  // Ignore SIGPIPE so `codespaces --json | head` exits cleanly
  std::signal(SIGPIPE, SIG_IGN);
  return codespaces::cli::run_cli(argc, argv);
}
