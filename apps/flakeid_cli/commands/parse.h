#pragma once

// cmd_parse: decode one or more ids given as positional decimal arguments.
int cmd_parse(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
