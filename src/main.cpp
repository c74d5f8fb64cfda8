#include "core/runner.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

struct Options {
  RunOptions run;
  bool help = false;
  std::string error;
};

static void PrintUsage(const char *argv0) {
  std::cerr << "usage: " << argv0
            << " -c COMMAND [-d DIR] [-e KEY=VALUE]... [--cols N] [--rows N]\n"
               "       [-t TIMEOUT_MS] [-o TRANSCRIPT_DIR] [--max-buffer BYTES]\n"
               "       [--spill-threshold BYTES] [--no-stdin]\n";
}

static Options ParseArgs(int argc, char **argv) {
  Options opt;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if ((a == "-c" || a == "--command") && i + 1 < argc)
      opt.run.command = argv[++i];
    else if ((a == "-d" || a == "--cwd") && i + 1 < argc)
      opt.run.cwd = argv[++i];
    else if ((a == "-e" || a == "--env") && i + 1 < argc) {
      std::string kv = argv[++i];
      auto eq = kv.find('=');
      if (eq == std::string::npos || eq == 0) {
        opt.error = "expected KEY=VALUE, got '" + kv + "'";
        return opt;
      }
      opt.run.env[kv.substr(0, eq)] = kv.substr(eq + 1);
    } else if (a == "--cols" && i + 1 < argc)
      opt.run.cols = static_cast<std::uint32_t>(std::max(0, std::atoi(argv[++i])));
    else if (a == "--rows" && i + 1 < argc)
      opt.run.rows = static_cast<std::uint32_t>(std::max(0, std::atoi(argv[++i])));
    else if ((a == "-t" || a == "--timeout-ms") && i + 1 < argc) {
      int ms = std::max(0, std::atoi(argv[++i]));
      if (ms > 0) {
        opt.run.timeout = std::chrono::milliseconds(ms);
      }
    } else if ((a == "-o" || a == "--out") && i + 1 < argc)
      opt.run.transcriptDir = argv[++i];
    else if (a == "--max-buffer" && i + 1 < argc)
      opt.run.maxBuffer = std::strtoull(argv[++i], nullptr, 10);
    else if (a == "--spill-threshold" && i + 1 < argc)
      opt.run.spillThreshold = std::strtoull(argv[++i], nullptr, 10);
    else if (a == "--no-stdin")
      opt.run.forwardStdin = false;
    else if (a == "-h" || a == "--help")
      opt.help = true;
    else {
      opt.error = "unknown or incomplete option '" + a + "'";
      return opt;
    }
  }
  if (!opt.help && opt.run.command.empty()) {
    opt.error = "missing -c COMMAND";
  }
  return opt;
}

int main(int argc, char **argv) {
  auto opt = ParseArgs(argc, argv);
  if (opt.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!opt.error.empty()) {
    std::cerr << argv[0] << ": " << opt.error << "\n";
    PrintUsage(argv[0]);
    return 2;
  }
  return Run(opt.run);
}
