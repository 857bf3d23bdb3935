#pragma once

// cmd_connect: record that a provider reached out to a seeker.
// Usage: beacon_cli connect --provider <id> --seeker <id> --db <db-path>
int cmd_connect(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_respond: accept or decline an existing connection on behalf of one party.
// Usage: beacon_cli respond --provider <id> --seeker <id> --as provider|seeker
//                           --response accepted|declined --db <db-path>
int cmd_respond(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
