#pragma once

// cmd_emit: append one audit event to the ledger and print the record.
int cmd_emit(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
