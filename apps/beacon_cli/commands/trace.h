#pragma once

// cmd_trace: print the audit events recorded under a trace id.
// Usage: beacon_cli trace --trace-id <id> --db <db-path>
int cmd_trace(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
