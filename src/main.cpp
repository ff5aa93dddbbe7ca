/**
 * @file main.cpp
 * @brief kcore command-line entry point.
 *
 *   kcore server [-c|--config FILE] [--enable-worker] [--profile NAME]
 *                [--data-dir DIR] [--debug] [join-token]
 *   kcore version
 *   kcore help
 */

#include "kcore/constants.hpp"
#include "kcore/log.hpp"
#include "kcore/server.hpp"

#include <cstdio>
#include <cstring>

static void PrintUsage(const char* prog) {
  std::printf(
      "Usage: %s <command> [options]\n"
      "\n"
      "Commands:\n"
      "  server [join-token]   Run a control-plane node\n"
      "  version               Print the version\n"
      "  help                  Show this help\n"
      "\n"
      "Server options:\n"
      "  -c, --config FILE     Cluster config file (default: %s)\n"
      "  --enable-worker       Also run worker components on this node\n"
      "  --profile NAME        Worker profile to use (default: %s)\n"
      "  --data-dir DIR        Data directory (default: %s)\n"
      "  --debug               Enable debug logging\n",
      prog, kcore::kDefaultConfigPath, kcore::kDefaultWorkerProfile,
      kcore::kDefaultDataDir);
}

int main(int argc, char* argv[]) {
  kcore::log::Init();

  if (argc < 2) {
    PrintUsage(argv[0]);
    return 2;
  }
  const char* cmd = argv[1];

  if (std::strcmp(cmd, "version") == 0) {
    std::printf("%s\n", kcore::kVersion);
    return 0;
  }
  if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 ||
      std::strcmp(cmd, "-h") == 0) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (std::strcmp(cmd, "server") != 0) {
    std::fprintf(stderr, "unknown command: %s\n\n", cmd);
    PrintUsage(argv[0]);
    return 2;
  }

  kcore::ServerOptions options;
  auto parsed = kcore::ParseServerArgs(argc - 2, argv + 2, options);
  if (!parsed) {
    PrintUsage(argv[0]);
    return kcore::ExitCode(parsed);
  }

  KCORE_LOG_INFO("Main", "kcore %s starting", kcore::kVersion);
  auto result = kcore::RunServer(options);
  if (!result) {
    KCORE_LOG_ERROR("Main", "server exited: %s",
                    kcore::ServerErrorToString(result.get_error()));
  }
  kcore::log::Shutdown();
  return kcore::ExitCode(result);
}
