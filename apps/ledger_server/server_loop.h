#pragma once

#include "server_context.h"
#include <istream>
#include <ostream>

namespace auditchain::server {

// run_server_loop reads one JSON-RPC request per line from in and writes one
// response per line to out until EOF. Notifications get no response.
void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out);

}  // namespace auditchain::server
