#pragma once

#include <cstddef>
#include <string>

class Config {
public:
    // Network
    static const std::string SERVER_HOST;
    static const int SERVER_PORT;
    static const int SERVER_THREADS;
    static const std::string BASE_URL;

    // Short links
    static const std::size_t SHORT_CODE_LENGTH;
    static const std::size_t MIN_CUSTOM_CODE_LENGTH;
    static const int DEFAULT_VALIDITY_MINUTES;
    static const int MAX_VALIDITY_MINUTES;
    static const std::size_t MAX_URL_LENGTH;

    // Geo lookup (empty URL keeps the static locator)
    static const std::string GEO_LOOKUP_URL;
    static const int GEO_LOOKUP_TIMEOUT_MS;

    // Error reporting
    static const std::string SENTRY_DSN;
    static const std::string SENTRY_ENVIRONMENT;
    static const std::string SERVICE_VERSION;
};
