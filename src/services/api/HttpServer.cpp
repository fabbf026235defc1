#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include "core/metadata/IndexStore.hpp"
#include "core/model/ModelJson.hpp"

using nlohmann::json;

namespace {

bool check_api_key(const httplib::Request& req,
                   const std::string& apiKey,
                   httplib::Response& res) {
  if (apiKey.empty()) return true;
  auto k = req.get_header_value("X-API-Key");
  if (k == apiKey) return true;
  res.status = 401;
  res.set_content("unauthorized", "text/plain");
  return false;
}

std::string param_or(const httplib::Request& req, const char* k, const std::string& def = {}) {
  if (req.has_param(k)) return req.get_param_value(k);
  return def;
}

void send_json(httplib::Response& res, const json& body, int status = 200) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

void send_error(httplib::Response& res, int status, const std::string& message) {
  send_json(res, json{{"error", message}}, status);
}

} // namespace

namespace sai {

void register_status_routes(httplib::Server& svr, IndexStore& store, const std::string& apiKey) {
  // One connection shared by the worker threads.
  auto mu = std::make_shared<std::mutex>();

  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  svr.Get("/stats", [&store, mu, apiKey](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    try {
      std::lock_guard<std::mutex> lock(*mu);
      send_json(res, to_json(store.stats()));
    } catch (const std::exception& e) {
      spdlog::error("GET /stats failed: {}", e.what());
      send_error(res, 500, "stats unavailable");
    }
  });

  svr.Get(R"(/submissions/(0x[0-9A-Fa-f]+))",
          [&store, mu, apiKey](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    std::string uid = req.matches[1];
    std::transform(uid.begin(), uid.end(), uid.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    try {
      std::lock_guard<std::mutex> lock(*mu);
      auto s = store.findSubmission(uid);
      if (!s) {
        send_error(res, 404, "submission not found");
        return;
      }
      json out = to_json(*s);
      out["record_count"] = store.countRecords(uid);
      send_json(res, out);
    } catch (const std::exception& e) {
      spdlog::error("GET /submissions/{} failed: {}", uid, e.what());
      send_error(res, 500, "lookup failed");
    }
  });

  svr.Get("/failures", [&store, mu, apiKey](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    int limit = 20;
    const std::string raw = param_or(req, "limit");
    if (!raw.empty()) {
      try {
        limit = std::stoi(raw);
      } catch (const std::exception&) {
        send_error(res, 400, "limit must be an integer");
        return;
      }
      if (limit < 1 || limit > 1000) {
        send_error(res, 400, "limit must be between 1 and 1000");
        return;
      }
    }
    try {
      std::lock_guard<std::mutex> lock(*mu);
      json arr = json::array();
      for (const auto& f : store.recentFailures(limit)) arr.push_back(to_json(f));
      send_json(res, arr);
    } catch (const std::exception& e) {
      spdlog::error("GET /failures failed: {}", e.what());
      send_error(res, 500, "failures unavailable");
    }
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) res.set_content("not found", "text/plain");
  });
}

void run_http_server(IndexStore& store, int port, const std::string& apiKey) {
  httplib::Server svr;
  register_status_routes(svr, store, apiKey);

  spdlog::info("HTTP server listening on http://0.0.0.0:{}", port);
  if (!svr.listen("0.0.0.0", port)) {
    throw std::runtime_error("failed to bind port " + std::to_string(port));
  }
}

} // namespace sai
