#pragma once

// cmd_generate: print new identifiers (--count, --json, --rollback-allowance, --on-rollback,
// --seed, --fixed-time)
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
