#pragma once

#include <chrono>
#include <string>

// Best-effort IP -> coarse location. Implementations never throw and never
// block longer than their configured timeout.
class GeoLocator {
public:
    static const std::string UNKNOWN_LOCATION;
    static const std::string LOCALHOST;

    virtual ~GeoLocator() = default;
    virtual std::string lookup(const std::string& ip) = 0;

    static bool isLoopback(const std::string& ip);
};

// No external provider: loopback is "Localhost", everything else unknown
class StaticGeoLocator : public GeoLocator {
public:
    std::string lookup(const std::string& ip) override;
};

// Queries <baseUrl>/json/<ip> and reads "city" / "country" from the JSON reply
class HttpGeoLocator : public GeoLocator {
public:
    HttpGeoLocator(std::string baseUrl, std::chrono::milliseconds timeout);

    std::string lookup(const std::string& ip) override;

    // Exposed for tests: turns a provider reply body into a location string
    static std::string parseLocation(const std::string& body);

private:
    std::string baseUrl;
    std::chrono::milliseconds timeout;
};
