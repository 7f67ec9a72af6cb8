#pragma once

// cmd_archive: archive records older than --older-than or --months of one scope.
int cmd_archive(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
