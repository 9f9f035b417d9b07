#pragma once

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <string>

// Console + Sentry logging for the HTTP layer and domain events.
// Console format: <date time> | <FileName> | <Class> | <function> | <details>
class SaveLogs {
public:
    // Sentry lifecycle; an empty DSN leaves the SDK initialised but silent
    static void init(const std::string& dsn, const std::string& environment, const std::string& release);
    static void shutdown();

    // Pre-routing hook: logs the request, applies CORS headers, starts the request timer
    static bool log_request(const httplib::Request &req, httplib::Response &res);

    // Post-routing hook: status code and processing time
    static void log_completed(const httplib::Request &req, const httplib::Response &res);

    // Domain events: URL_CREATED, URL_REDIRECT, STATS_ACCESSED
    static void log_event(const std::string &eventType, const nlohmann::json &data);

    // Caller-visible failures (not found, expired, validation); sent to Sentry as warnings
    static void log_error(const std::string &errorType, const std::string &message);

    // Unexpected faults; sent to Sentry as errors
    static void log_exception(const std::string &where, const std::string &message);

private:
    static void write_line(const char *function, const std::string &details);
};
