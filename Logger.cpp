#include "Logger.h"
#include "TimeUtils.h"
#include <sentry.h>
#include <chrono>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

using namespace httplib;
using namespace std;

// --- CORS Configuration ---
const string CORS_HEADER_KEY = "Access-Control-Allow-Origin";
const string CORS_HEADER_VALUE = "*";

namespace {

mutex consoleMutex;

// httplib runs pre-routing, the handler and the logger on one worker thread
thread_local chrono::steady_clock::time_point requestStart;

sentry_value_t new_string_map(std::initializer_list<pair<const char *, string>> fields) {
    sentry_value_t obj = sentry_value_new_object();
    for (const auto &field : fields) {
        sentry_value_set_by_key(obj, field.first, sentry_value_new_string(field.second.c_str()));
    }
    return obj;
}

void add_breadcrumb(const char *type, const char *category, const string &message) {
    sentry_value_t crumb = sentry_value_new_breadcrumb(type, message.c_str());
    sentry_value_set_by_key(crumb, "category", sentry_value_new_string(category));
    sentry_add_breadcrumb(crumb);
}

} // namespace

void SaveLogs::init(const string &dsn, const string &environment, const string &release) {
    sentry_options_t *options = sentry_options_new();
    if (!dsn.empty()) {
        sentry_options_set_dsn(options, dsn.c_str());
    }
    sentry_options_set_environment(options, environment.c_str());
    sentry_options_set_release(options, ("url-shortener@" + release).c_str());
    if (sentry_init(options) != 0) {
        write_line("init", "Sentry initialisation failed, continuing with console logging only");
        return;
    }
    write_line("init", dsn.empty() ? "Sentry DSN not set, events stay local"
                                   : "Sentry error reporting enabled (" + environment + ")");
}

void SaveLogs::shutdown() {
    sentry_close();
}

void SaveLogs::write_line(const char *function, const string &details) {
    lock_guard<mutex> lock(consoleMutex);
    cerr << getCurrentTimestamp() << " | Logger.cpp | SaveLogs | " << function << " | " << details << endl;
}

bool SaveLogs::log_request(const Request &req, Response &res) {
    requestStart = chrono::steady_clock::now();

    // 1. Prepare Request Details
    string payload_summary;
    string full_payload = (req.method == "POST" || req.method == "PUT") ? req.body : "[N/A]";

    if (full_payload != "[N/A]") {
        const size_t max_len = 100;
        payload_summary = (full_payload.size() < max_len) ? full_payload : full_payload.substr(0, max_len) + "...";
    } else {
        payload_summary = full_payload;
    }

    // 2. Add CORS headers to every response
    res.set_header(CORS_HEADER_KEY, CORS_HEADER_VALUE);
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");

    // 3. Breadcrumb so a later Sentry event carries the request trail
    add_breadcrumb("http", "http.request", req.method + " " + req.path + " from " + req.remote_addr);

    // 4. Log to console
    write_line("log_request", "IP: " + req.remote_addr + ", Method: " + req.method + ", Path: " + req.path +
                              ", User-Agent: " + req.get_header_value("User-Agent") +
                              " | Payload: " + payload_summary);

    return true;
}

void SaveLogs::log_completed(const Request &req, const Response &res) {
    double elapsedMs = chrono::duration<double, milli>(chrono::steady_clock::now() - requestStart).count();

    stringstream ss;
    ss << "[REQUEST_COMPLETED] Path: " << req.path << ", Status: " << res.status
       << ", Time: " << elapsedMs << " ms";
    write_line("log_completed", ss.str());
}

void SaveLogs::log_event(const string &eventType, const nlohmann::json &data) {
    string payload = data.dump();
    add_breadcrumb("info", eventType.c_str(), payload);
    write_line("log_event", "[EVENT] " + eventType + " " + payload);
}

void SaveLogs::log_error(const string &errorType, const string &message) {
    sentry_value_t event = sentry_value_new_message_event(SENTRY_LEVEL_WARNING, "url_shortener", message.c_str());
    sentry_value_set_by_key(event, "tags", new_string_map({{"error.type", errorType},
                                                           {"app.class", "SaveLogs"}}));
    sentry_capture_event(event);

    write_line("log_error", "[ERROR] " + errorType + " " + message);
}

void SaveLogs::log_exception(const string &where, const string &message) {
    sentry_value_t event = sentry_value_new_message_event(SENTRY_LEVEL_ERROR, "url_shortener", message.c_str());
    sentry_value_set_by_key(event, "tags", new_string_map({{"error.type", "Internal"},
                                                           {"app.location", where}}));
    sentry_capture_event(event);

    write_line("log_exception", "[INTERNAL] " + where + ": " + message);
}
