#pragma once

// cmd_shipper_health: PING the log shipping Redis named by --redis.
int cmd_shipper_health(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
