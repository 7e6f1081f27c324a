#include <iostream>
#include <stdexcept>
#include <string>

// HTTP сервер на cpp-httplib (header-only)
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "address_resolver.h"
#include "config.h"
#include "errors.h"
#include "logger.h"
#include "parking_api.h"
#include "pricing_engine.h"
#include "time_zone.h"
#include "zone_registry.h"

using json = nlohmann::json;
using namespace std;
using namespace nprpark;

namespace {

// traceId из заголовка или новый
string traceIdFor(const httplib::Request& req) {
    string traceId = req.get_header_value("X-Request-Id");
    if (traceId.empty()) {
        traceId = generateUUID();
    }
    return traceId;
}

void sendResponse(httplib::Response& res, const ApiResponse& response, const string& traceId) {
    res.status = response.status;
    if (!traceId.empty()) {
        res.set_header("X-Request-Id", traceId);
    }
    res.set_content(response.body.dump(), "application/json");
}

} // namespace

int main() {
    Config config;
    setLogLevel(config.log_level);

    logEvent(LogLevel::INFO, "NPR parking service starting", "", {
        {"host", config.host},
        {"port", config.port},
        {"dataset", config.dataset_path},
        {"timezone", config.timezone},
        {"timezoneDb", config.timezone_db_path},
        {"maxSpanDays", config.max_span_days}
    });

    TimeZone zone;
    try {
        zone = TimeZone::load(config.timezone, config.timezone_db_path);
    } catch (const std::runtime_error& e) {
        cerr << "Failed to load time zone: " << e.what() << endl;
        return 1;
    }

    // Набор тарифов загружается до того, как сервис начнёт принимать запросы
    ZoneRegistry registry;
    try {
        registry.reload(config.dataset_path);
    } catch (const TariffError& e) {
        cerr << "Failed to load tariff dataset: " << e.what() << endl;
        return 1;
    }

    PostcodeZoneResolver resolver;
    try {
        resolver.loadFromFile(config.zone_mapping_path);
        logEvent(LogLevel::INFO, "Postcode zone mapping loaded", "", {
            {"path", config.zone_mapping_path},
            {"areas", resolver.size()}
        });
    } catch (const TariffError& e) {
        logEvent(LogLevel::WARN, "Postcode zone mapping unavailable, address lookups will fail", "", {
            {"path", config.zone_mapping_path},
            {"error", e.what()}
        });
    }

    PricingEngine engine(registry, zone, config.max_span_days);
    ParkingApi api(registry, engine, resolver, config.dataset_path);

    httplib::Server server;

    // CORS middleware
    server.set_pre_routing_handler([](const httplib::Request& req, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization, X-Request-Id");
        return httplib::Server::HandlerResponse::Unhandled;
    });

    // OPTIONS handler for CORS
    server.Options(R"(.*)", [](const httplib::Request& req, httplib::Response& res) {
        res.status = 200;
    });

    server.Get("/", [&api](const httplib::Request& req, httplib::Response& res) {
        sendResponse(res, api.index(), "");
    });

    server.Get("/healthz", [&api](const httplib::Request& req, httplib::Response& res) {
        sendResponse(res, api.health(), "");
    });

    server.Get("/readyz", [&api](const httplib::Request& req, httplib::Response& res) {
        sendResponse(res, api.ready(), "");
    });

    server.Post("/calculate", [&api](const httplib::Request& req, httplib::Response& res) {
        string traceId = traceIdFor(req);
        logRequest("POST", "/calculate", traceId);
        sendResponse(res, api.calculate(req.body, traceId), traceId);
    });

    server.Get("/zones", [&api](const httplib::Request& req, httplib::Response& res) {
        string traceId = traceIdFor(req);
        logRequest("GET", "/zones", traceId);
        sendResponse(res, api.listZones(traceId), traceId);
    });

    server.Get("/zones/search", [&api](const httplib::Request& req, httplib::Response& res) {
        string traceId = traceIdFor(req);
        logRequest("GET", "/zones/search", traceId);
        sendResponse(res, api.searchZones(req.get_param_value("q"), traceId), traceId);
    });

    server.Get(R"(/zones/([^/]+)/tariff)", [&api](const httplib::Request& req, httplib::Response& res) {
        string traceId = traceIdFor(req);
        logRequest("GET", req.path, traceId);
        sendResponse(res, api.zoneTariff(req.matches[1], req.get_param_value("date"), traceId), traceId);
    });

    server.Post("/admin/reload", [&api](const httplib::Request& req, httplib::Response& res) {
        string traceId = traceIdFor(req);
        logRequest("POST", "/admin/reload", traceId);
        sendResponse(res, api.reload(traceId), traceId);
    });

    logEvent(LogLevel::INFO, "NPR parking service listening", "", {
        {"url", "http://" + config.host + ":" + to_string(config.port)},
        {"zonesLoaded", registry.zoneCount()}
    });

    if (!server.listen(config.host.c_str(), config.port)) {
        cerr << "Failed to start server on port " << config.port << endl;
        return 1;
    }

    return 0;
}
