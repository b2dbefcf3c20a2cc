#include "cli.hpp"
#include "config.hpp"
#include "log.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
  Config cfg = Config::defaults();
  std::string msg;
  if (!cfg.load_rc(msg)) log_warn(msg);
  log_set_level(cfg.log_level);
  log_init_from_env();
  std::vector<std::string> args(argv + 1, argv + argc);
  Cli cli(std::move(cfg), std::cout, std::cerr);
  return cli.run(args);
}
