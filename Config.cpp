#include "Config.h"
#include <cstdlib>
#include <string>
#include <iostream>
#include <stdexcept>

// Reads an environment variable, falling back to a local default when unset or empty.
static std::string getEnv(const char* name, const std::string& defaultValue = "") {
    const char* value = std::getenv(name);
    if (value && value[0] != '\0') {
        return std::string(value);
    }
    return defaultValue;
}

// Numeric settings keep their default when the variable does not parse.
static int getEnvInt(const char* name, int defaultValue) {
    std::string raw = getEnv(name);
    if (raw.empty()) {
        return defaultValue;
    }
    try {
        size_t consumed = 0;
        int parsed = std::stoi(raw, &consumed);
        if (consumed == raw.size() && parsed > 0) {
            return parsed;
        }
    } catch (const std::exception&) {
    }
    std::cerr << "CONFIG_WARNING: Ignoring invalid value '" << raw << "' for " << name
              << ", using default " << defaultValue << std::endl;
    return defaultValue;
}

// --- Definitions of Static Member Variables ---

// Network
const std::string Config::SERVER_HOST = getEnv("SERVER_HOST", "0.0.0.0");
const int Config::SERVER_PORT = getEnvInt("SERVER_PORT", 8000);
const int Config::SERVER_THREADS = getEnvInt("SERVER_THREADS", 8);
const std::string Config::BASE_URL = getEnv("BASE_URL", "http://localhost:8000/");

// Short links
const std::size_t Config::SHORT_CODE_LENGTH = static_cast<std::size_t>(getEnvInt("SHORT_CODE_LENGTH", 6));
const std::size_t Config::MIN_CUSTOM_CODE_LENGTH = 4;
const int Config::DEFAULT_VALIDITY_MINUTES = getEnvInt("DEFAULT_VALIDITY_MINUTES", 30);
const int Config::MAX_VALIDITY_MINUTES = getEnvInt("MAX_VALIDITY_MINUTES", 5256000); // 10 years
const std::size_t Config::MAX_URL_LENGTH = 2048;

// Geo lookup
const std::string Config::GEO_LOOKUP_URL = getEnv("GEO_LOOKUP_URL", "");
const int Config::GEO_LOOKUP_TIMEOUT_MS = getEnvInt("GEO_LOOKUP_TIMEOUT_MS", 300);

// Error reporting (an empty DSN keeps Sentry inert)
const std::string Config::SENTRY_DSN = getEnv("SENTRY_DSN", "");
const std::string Config::SENTRY_ENVIRONMENT = getEnv("SENTRY_ENVIRONMENT", "development");
const std::string Config::SERVICE_VERSION = "1.0.0";
