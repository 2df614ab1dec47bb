#pragma once

// cmd_generate: mint ids for this node using the system clock.
// Node id comes from --node-id, else the NODE_ID environment variable, else 0.
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
