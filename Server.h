#pragma once
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <csignal>
#include <string>

#include "AnalyticsReporter.h"
#include "Config.h"
#include "LinkRegistry.h"
#include "RedirectResolver.h"
#include "RegistryError.h"
#include "Modals/RequestContext.h"

class UrlShortenerServer {
public:
    UrlShortenerServer(LinkRegistry& registry_instance,
                       RedirectResolver& resolver_instance,
                       AnalyticsReporter& reporter_instance,
                       std::string baseUrl = Config::BASE_URL,
                       int workerThreads = Config::SERVER_THREADS);

    // Blocks until stop() is called
    bool run(const std::string& host = Config::SERVER_HOST, int port = Config::SERVER_PORT);

    // Like run(), but also stops once `stopFlag` becomes non-zero. The flag may be
    // set from a signal handler; a watcher thread polls it and calls stop().
    bool runUntil(const std::string& host, int port, const volatile std::sig_atomic_t& stopFlag);

    // Two-step start used by tests: bind an ephemeral port, then serve on it
    int bindToAnyPort(const std::string& host);
    bool listenAfterBind();

    void stop();
    bool isRunning() const;

    static int httpStatusFor(ErrorCode code);

private:
    httplib::Server svr;
    LinkRegistry& registry;
    RedirectResolver& resolver;
    AnalyticsReporter& reporter;
    std::string baseUrl;

    // --- Middleware ---
    void setupMiddleware();

    // --- Utility ---
    static RequestContext buildRequestContext(const httplib::Request &req);
    static void sendJson(httplib::Response &res, int status, const nlohmann::json &body);
    static void sendError(httplib::Response &res, const RegistryError &error);

    // --- Routes ---
    void setupRoutes();
    void handleRoot(const httplib::Request &req, httplib::Response &res);
    void handleHealth(const httplib::Request &req, httplib::Response &res);
    void handleCreate(const httplib::Request &req, httplib::Response &res);
    void handleStats(const httplib::Request &req, httplib::Response &res);
    void handleRedirect(const httplib::Request &req, httplib::Response &res);
};
