#include "auditchain/core/version.h"

#include "commands/archive.h"
#include "commands/emit.h"
#include "commands/exit_codes.h"
#include "commands/query.h"
#include "commands/shipper_health.h"
#include "commands/verify.h"
#include <iostream>
#include <string>
#include <unordered_map>

namespace {

using Command = int (*)(int, char**);

void print_usage() {
  std::cerr << "auditchain_cli v" << auditchain::core::kBuildVersion << "\n"
            << "Usage: auditchain_cli <command> [options]\n\n"
            << "Commands:\n"
            << "  emit            Append one audit event (--action required)\n"
            << "  verify          Verify chain integrity (exit 2 on violations)\n"
            << "  archive         Archive old records behind a checkpoint\n"
            << "  query           List records, newest first\n"
            << "  shipper-health  Check the log shipping Redis\n\n"
            << "Common options:\n"
            << "  --db <path>     SQLite database (default data/auditchain.db)\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  const std::unordered_map<std::string, Command> commands = {
      {"emit", cmd_emit},       {"verify", cmd_verify},
      {"archive", cmd_archive}, {"query", cmd_query},
      {"shipper-health", cmd_shipper_health},
  };

  if (argc < 2) {
    print_usage();
    return kExitError;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_usage();
    return kExitOk;
  }

  auto it = commands.find(subcommand);
  if (it == commands.end()) {
    std::cerr << "Unknown command: " << subcommand << "\n";
    print_usage();
    return kExitError;
  }

  return it->second(argc, argv);
}
