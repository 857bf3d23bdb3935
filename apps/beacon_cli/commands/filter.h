#pragma once

// cmd_filter: list candidates that clear provider, seeker and bilateral floors.
// Usage: beacon_cli filter --provider <id> [--candidates id,...] [--min-provider X]
//                          [--min-seeker X] [--min-bilateral X] [store flags]
int cmd_filter(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
