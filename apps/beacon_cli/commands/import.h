#pragma once

// cmd_import: load a provider/seeker dataset into the SQLite store.
// Usage: beacon_cli import --providers <file> --seekers <file> --db <db-path>
int cmd_import(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
