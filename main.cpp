/**
 * @file main.cpp
 * @brief Main entry point for the URL Shortener Service application.
 *
 * Wires the application components together: the in-memory link registry,
 * the redirect resolver and analytics reporter built on it, and the HTTP
 * server (UrlShortenerServer). All state lives in the registry owned by this
 * function, so it is created at startup and discarded at shutdown.
 */

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include "AnalyticsReporter.h"
#include "CodeGenerator.h"
#include "Config.h"
#include "GeoLocator.h"
#include "LinkRegistry.h"
#include "Logger.h"
#include "RedirectResolver.h"
#include "Server.h"

using namespace std;

namespace {

// Only an async-signal-safe store happens in the handler; the server's watcher does the stop
volatile std::sig_atomic_t stopRequested = 0;

void handleSignal(int) {
    stopRequested = 1;
}

std::unique_ptr<GeoLocator> makeGeoLocator() {
    if (Config::GEO_LOOKUP_URL.empty()) {
        return std::make_unique<StaticGeoLocator>();
    }
    cerr << "RUNNING: Geo lookup via " << Config::GEO_LOOKUP_URL
         << " (timeout " << Config::GEO_LOOKUP_TIMEOUT_MS << " ms)" << endl;
    return std::make_unique<HttpGeoLocator>(Config::GEO_LOOKUP_URL,
                                            std::chrono::milliseconds(Config::GEO_LOOKUP_TIMEOUT_MS));
}

} // namespace

// --- Main Entry Point ---

/**
 * @brief Main function where the application execution begins.
 * @return 0 on clean shutdown, 1 on fatal error (e.g., the port cannot be bound).
 */
int main() {
    cerr << "RUNNING: Starting URL Shortener Service initialization..." << endl;

    // 1. Error reporting first so startup failures are captured
    SaveLogs::init(Config::SENTRY_DSN, Config::SENTRY_ENVIRONMENT, Config::SERVICE_VERSION);

    int exitCode = 0;
    try {
        // 2. Core components; the registry is shared by every request worker
        CodeGenerator generator(Config::SHORT_CODE_LENGTH);
        LinkRegistry registry(generator);
        std::unique_ptr<GeoLocator> geoLocator = makeGeoLocator();
        RedirectResolver resolver(registry, *geoLocator);
        AnalyticsReporter reporter(registry);

        // 3. HTTP server
        UrlShortenerServer app(registry, resolver, reporter, Config::BASE_URL, Config::SERVER_THREADS);
        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        cerr << "Listening on http://" << Config::SERVER_HOST << ":" << Config::SERVER_PORT << endl;
        if (!app.runUntil(Config::SERVER_HOST, Config::SERVER_PORT, stopRequested)) {
            cerr << "FATAL: Server failed to start on port " << Config::SERVER_PORT << "." << endl;
            exitCode = 1;
        }
    } catch (const std::exception& e) {
        SaveLogs::log_exception("main", e.what());
        cerr << "FATAL: " << e.what() << endl;
        exitCode = 1;
    }

    cerr << "RUNNING: URL Shortener Service stopped." << endl;
    SaveLogs::shutdown();
    return exitCode;
}
