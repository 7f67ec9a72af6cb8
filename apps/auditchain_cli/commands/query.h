#pragma once

// cmd_query: list records matching the filter flags, newest first.
int cmd_query(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
