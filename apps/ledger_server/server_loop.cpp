#include "server_loop.h"

#include "jsonrpc_protocol.h"
#include "method_handlers.h"
#include <iostream>
#include <string>

namespace auditchain::server {

void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out) {
  // Method registry
  const auto method_registry = build_method_registry();

  // Main loop: read JSON-RPC requests from in, write responses to out
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }

    auto request = parse_request(line);
    if (!request.has_value()) {
      out << make_error_response(std::nullopt, request.error()) << "\n" << std::flush;
      continue;
    }

    std::cerr << "Received: " << request.value().method << "\n";

    const std::string response = dispatch_request(request.value(), method_registry, ctx);
    if (!response.empty()) {
      out << response << "\n" << std::flush;
    }
  }

  std::cerr << "Ledger server shutting down\n";
}

}  // namespace auditchain::server
