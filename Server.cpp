#include "Server.h"
#include "JsonMapper.h"
#include "Logger.h"
#include "TimeUtils.h"
#include <atomic>
#include <chrono>
#include <exception>
#include <iostream>
#include <thread>
#include <utility>

using namespace std;
using json = nlohmann::json;

// --- Class Implementation ---

UrlShortenerServer::UrlShortenerServer(LinkRegistry& registry_instance,
                                       RedirectResolver& resolver_instance,
                                       AnalyticsReporter& reporter_instance,
                                       std::string baseUrl,
                                       int workerThreads)
    : registry(registry_instance), resolver(resolver_instance), reporter(reporter_instance),
      baseUrl(std::move(baseUrl)) {
    size_t threads = workerThreads > 0 ? static_cast<size_t>(workerThreads) : 1;
    svr.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    setupMiddleware();
    setupRoutes();
}

bool UrlShortenerServer::run(const std::string& host, int port) {
    cerr << "Starting URL Shortener Service on " << host << ":" << port << "..." << endl;
    return svr.listen(host, port);
}

bool UrlShortenerServer::runUntil(const std::string& host, int port, const volatile std::sig_atomic_t& stopFlag) {
    std::atomic<bool> finished{false};
    std::thread watcher([this, &stopFlag, &finished] {
        while (!finished.load()) {
            // stop() is a no-op until listen is up, so keep polling until it takes
            if (stopFlag != 0 && svr.is_running()) {
                svr.stop();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    bool ok = run(host, port);
    finished = true;
    watcher.join();
    return ok;
}

int UrlShortenerServer::bindToAnyPort(const std::string& host) {
    return svr.bind_to_any_port(host);
}

bool UrlShortenerServer::listenAfterBind() {
    return svr.listen_after_bind();
}

void UrlShortenerServer::stop() {
    svr.stop();
}

bool UrlShortenerServer::isRunning() const {
    return svr.is_running();
}

// --- Utility Implementation ---

int UrlShortenerServer::httpStatusFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidUrl:
        case ErrorCode::InvalidCode:
        case ErrorCode::InvalidValidity:
        case ErrorCode::CodeTaken:
            return 400;
        case ErrorCode::NotFound:
            return 404;
        case ErrorCode::Expired:
            return 410;
        case ErrorCode::Internal:
            return 500;
    }
    return 500;
}

RequestContext UrlShortenerServer::buildRequestContext(const httplib::Request &req) {
    RequestContext ctx;
    ctx.referrer = req.get_header_value("Referer");
    ctx.userAgent = req.get_header_value("User-Agent");
    ctx.ip = req.remote_addr;
    return ctx;
}

void UrlShortenerServer::sendJson(httplib::Response &res, int status, const json &body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void UrlShortenerServer::sendError(httplib::Response &res, const RegistryError &error) {
    int status = httpStatusFor(error.code());
    // Internal faults never echo their message to the client
    string detail = status == 500 ? "Internal server error" : error.what();
    sendJson(res, status, JsonMapper::errorDetail(detail));
}

// --- Middleware Setup ---
void UrlShortenerServer::setupMiddleware() {
    svr.set_pre_routing_handler([](const httplib::Request &req, httplib::Response &res) {
        SaveLogs::log_request(req, res);
        return httplib::Server::HandlerResponse::Unhandled;
    });

    svr.set_logger([](const httplib::Request &req, const httplib::Response &res) {
        SaveLogs::log_completed(req, res);
    });

    // Unmatched routes and other transport errors get the same JSON error shape
    svr.set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (res.body.empty()) {
            string detail = res.status == 404 ? "Not found" : httplib::status_message(res.status);
            res.set_content(JsonMapper::errorDetail(detail).dump(), "application/json");
        }
    });

    svr.set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        string message = "unknown exception";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception &e) {
            message = e.what();
        } catch (...) {
            message = "non-standard exception";
        }
        SaveLogs::log_exception(req.method + " " + req.path, message);
        sendJson(res, 500, JsonMapper::errorDetail("Internal server error"));
    });
}

// --- Route Setup ---
void UrlShortenerServer::setupRoutes() {
    // GET / - Service information
    svr.Get("/", [this](const httplib::Request &req, httplib::Response &res) {
        this->handleRoot(req, res);
    });

    // GET /health - Liveness probe, registered before the catch-all redirect route
    svr.Get("/health", [this](const httplib::Request &req, httplib::Response &res) {
        this->handleHealth(req, res);
    });

    // POST /shorturls - Link Creation Endpoint
    svr.Post("/shorturls", [this](const httplib::Request &req, httplib::Response &res) {
        this->handleCreate(req, res);
    });

    // GET /shorturls/<code> - Link Analytics
    svr.Get(R"(/shorturls/([A-Za-z0-9]+))", [this](const httplib::Request &req, httplib::Response &res) {
        this->handleStats(req, res);
    });

    // GET /<code> - Redirection Endpoint
    svr.Get(R"(/([A-Za-z0-9]+))", [this](const httplib::Request &req, httplib::Response &res) {
        this->handleRedirect(req, res);
    });

    // CORS preflight; headers are applied by the pre-routing handler
    svr.Options(R"(.*)", [](const httplib::Request &req, httplib::Response &res) {
        res.status = 204;
    });
}

// --- Route Handlers ---

void UrlShortenerServer::handleRoot(const httplib::Request &req, httplib::Response &res) {
    sendJson(res, 200, json{
        {"message", "URL Shortener API"},
        {"version", Config::SERVICE_VERSION},
        {"endpoints", {
            {"create_url", "POST /shorturls"},
            {"redirect", "GET /{shortcode}"},
            {"stats", "GET /shorturls/{shortcode}"},
            {"health", "GET /health"}
        }}
    });
}

void UrlShortenerServer::handleHealth(const httplib::Request &req, httplib::Response &res) {
    sendJson(res, 200, json{
        {"status", "healthy"},
        {"timestamp", toIso8601(registry.now())},
        {"total_urls", registry.size()}
    });
}

void UrlShortenerServer::handleCreate(const httplib::Request &req, httplib::Response &res) {
    try {
        CreateLinkRequest request = JsonMapper::parseCreateRequest(req.body);
        LinkRecord record = registry.create(request.url, request.validity, request.shortcode);

        auto validity = std::chrono::duration_cast<std::chrono::minutes>(record.expires_at - record.created_at);
        SaveLogs::log_event("URL_CREATED", json{
            {"shortcode", record.shortcode},
            {"url", record.original_url},
            {"validity", validity.count()}
        });

        sendJson(res, 201, JsonMapper::createdLink(record, baseUrl));
    } catch (const RegistryError &e) {
        SaveLogs::log_error(e.code() == ErrorCode::CodeTaken ? "SHORTCODE_EXISTS" : "INVALID_REQUEST", e.what());
        sendError(res, e);
    }
}

void UrlShortenerServer::handleStats(const httplib::Request &req, httplib::Response &res) {
    string code = req.matches[1];

    try {
        LinkStats stats = reporter.report(code);
        SaveLogs::log_event("STATS_ACCESSED", json{
            {"shortcode", stats.shortcode},
            {"total_clicks", stats.total_clicks}
        });
        sendJson(res, 200, JsonMapper::linkStats(stats));
    } catch (const RegistryError &e) {
        SaveLogs::log_error("STATS_NOT_FOUND", e.what());
        sendError(res, e);
    }
}

void UrlShortenerServer::handleRedirect(const httplib::Request &req, httplib::Response &res) {
    string code = req.matches[1];
    RequestContext ctx = buildRequestContext(req);

    try {
        string destination = resolver.resolve(code, ctx);
        SaveLogs::log_event("URL_REDIRECT", json{
            {"shortcode", code},
            {"destination", destination},
            {"client_ip", ctx.ip}
        });
        res.set_redirect(destination);
    } catch (const RegistryError &e) {
        SaveLogs::log_error(e.code() == ErrorCode::Expired ? "URL_EXPIRED" : "SHORTCODE_NOT_FOUND", e.what());
        sendError(res, e);
    }
}
