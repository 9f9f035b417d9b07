#include "GeoLocator.h"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <utility>

using json = nlohmann::json;

const std::string GeoLocator::UNKNOWN_LOCATION = "Unknown Location";
const std::string GeoLocator::LOCALHOST = "Localhost";

bool GeoLocator::isLoopback(const std::string& ip) {
    return ip == "localhost" || ip == "::1" || ip.rfind("127.", 0) == 0 || ip == "::ffff:127.0.0.1";
}

std::string StaticGeoLocator::lookup(const std::string& ip) {
    return isLoopback(ip) ? LOCALHOST : UNKNOWN_LOCATION;
}

HttpGeoLocator::HttpGeoLocator(std::string baseUrl, std::chrono::milliseconds timeout)
    : baseUrl(std::move(baseUrl)), timeout(timeout) {
    while (!this->baseUrl.empty() && this->baseUrl.back() == '/') {
        this->baseUrl.pop_back();
    }
}

std::string HttpGeoLocator::parseLocation(const std::string& body) {
    json reply = json::parse(body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        return UNKNOWN_LOCATION;
    }
    if (reply.contains("status") && reply["status"] != "success") {
        return UNKNOWN_LOCATION;
    }

    auto stringField = [&reply](const char* key) -> std::string {
        auto it = reply.find(key);
        return (it != reply.end() && it->is_string()) ? it->get<std::string>() : std::string();
    };
    std::string city = stringField("city");
    std::string country = stringField("country");
    if (!city.empty() && !country.empty()) {
        return city + ", " + country;
    }
    if (!country.empty()) {
        return country;
    }
    return city.empty() ? UNKNOWN_LOCATION : city;
}

std::string HttpGeoLocator::lookup(const std::string& ip) {
    if (isLoopback(ip)) {
        return LOCALHOST;
    }
    if (ip.empty() || baseUrl.empty()) {
        return UNKNOWN_LOCATION;
    }

    try {
        // Constructed per lookup: httplib clients are not shared across worker threads
        httplib::Client cli(baseUrl);
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout);
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(timeout - seconds);
        cli.set_connection_timeout(seconds.count(), micros.count());
        cli.set_read_timeout(seconds.count(), micros.count());
        cli.set_write_timeout(seconds.count(), micros.count());

        auto res = cli.Get("/json/" + ip);
        if (!res) {
            std::cerr << "GEO_WARNING: Lookup for " << ip << " failed: "
                      << httplib::to_string(res.error()) << std::endl;
            return UNKNOWN_LOCATION;
        }
        if (res->status != 200) {
            std::cerr << "GEO_WARNING: Lookup for " << ip << " returned status " << res->status << std::endl;
            return UNKNOWN_LOCATION;
        }
        return parseLocation(res->body);
    } catch (const std::exception& e) {
        std::cerr << "GEO_WARNING: Lookup for " << ip << " threw: " << e.what() << std::endl;
        return UNKNOWN_LOCATION;
    }
}
