#pragma once

// cmd_verify: verify one scope (--workspace <id> | --global) or every scope.
int cmd_verify(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
