#pragma once

// cmd_inspect: decode one or more identifiers given as positional arguments
int cmd_inspect(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
