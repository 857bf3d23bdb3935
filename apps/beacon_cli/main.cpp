#include "beacon/core/version.h"

#include "commands/connect.h"
#include "commands/connections.h"
#include "commands/feed.h"
#include "commands/filter.h"
#include "commands/import.h"
#include "commands/score.h"
#include "commands/trace.h"

#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "beacon " << beacon::core::kBuildVersion << "\n"
            << "Usage: beacon_cli <command> [options]\n\n"
            << "Commands:\n"
            << "  import       Load providers and seekers from JSON files\n"
            << "  score        Score one provider/seeker pair\n"
            << "  feed         Ranked candidate feed for a provider\n"
            << "  filter       Candidates clearing provider, seeker and bilateral floors\n"
            << "  connect      Record a connection request\n"
            << "  respond      Accept or decline a connection\n"
            << "  connections  List sent (--provider) or received (--seeker) connections\n"
            << "  trace        Print audit events for a trace id\n\n"
            << "Run 'beacon_cli <command> --help' for command options.\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 2;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "import") {
    return cmd_import(argc, argv);
  }
  if (subcommand == "score") {
    return cmd_score(argc, argv);
  }
  if (subcommand == "feed") {
    return cmd_feed(argc, argv);
  }
  if (subcommand == "filter") {
    return cmd_filter(argc, argv);
  }
  if (subcommand == "connect") {
    return cmd_connect(argc, argv);
  }
  if (subcommand == "respond") {
    return cmd_respond(argc, argv);
  }
  if (subcommand == "connections") {
    return cmd_connections(argc, argv);
  }
  if (subcommand == "trace") {
    return cmd_trace(argc, argv);
  }
  if (subcommand == "--help" || subcommand == "help") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 2;
}
