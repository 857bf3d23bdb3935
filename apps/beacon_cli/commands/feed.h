#pragma once

// cmd_feed: print a ranked candidate feed for one provider.
// Usage: beacon_cli feed --provider <id> [--size N] [--min-score X] [--exclude id,...]
//                        [--workers N] [store and reasoning flags]
// SIGINT cancels an in-flight feed; nothing is printed for a cancelled feed.
int cmd_feed(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
