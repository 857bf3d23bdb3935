#pragma once

// cmd_connections: list a provider's sent requests or a seeker's received ones.
// Usage: beacon_cli connections sent --provider <id> --db <db-path>
//        beacon_cli connections received --seeker <id> --db <db-path>
int cmd_connections(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
