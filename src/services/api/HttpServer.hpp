#pragma once
#include <string>

namespace httplib { class Server; }

namespace sai {

class IndexStore;

// Read-only status endpoints: /health, /stats, /submissions/<uid>,
// /failures?limit=N. apiKey: if empty, auth is disabled.
void register_status_routes(httplib::Server& svr, IndexStore& store, const std::string& apiKey);

// Start a blocking HTTP server with the status endpoints.
void run_http_server(IndexStore& store, int port, const std::string& apiKey);

} // namespace sai
