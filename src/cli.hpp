#pragma once
/*
 * Cli
 *
 * Purpose: headless front end for the buffer and recovery engine.
 *   cat, insert, delete        load, edit and save a file through TextBuffer
 *   recover list|show|restore|cleanup
 *   session check              report whether the previous session crashed
 * Output goes to the given streams so commands can be driven from tests.
 */
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>
#include "cmd_registry.hpp"
#include "config.hpp"
#include "ifilesystem.hpp"

class LoopbackAgent;

class Cli {
public:
  Cli(Config cfg, std::ostream& out, std::ostream& err);
  ~Cli();

  /* argv without the program name; returns the process exit code */
  int run(const std::vector<std::string>& args);

private:
  void register_commands();
  bool setup_filesystem(bool loopback);
  int usage();
  int report(const std::string& what, const Error& e);

  Config cfg_;
  std::ostream& out_;
  std::ostream& err_;
  CommandRegistry registry_;
  std::unique_ptr<LoopbackAgent> agent_;
  std::shared_ptr<IFileSystem> fs_;
};
