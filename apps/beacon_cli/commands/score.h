#pragma once

// cmd_score: score one provider/seeker pair.
// Usage: beacon_cli score --provider <id> --seeker <id> [--goals] [store and reasoning flags]
int cmd_score(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
