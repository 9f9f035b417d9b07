#include "JsonMapper.h"
#include "RegistryError.h"
#include "TimeUtils.h"
#include <cstdint>
#include <limits>

using json = nlohmann::json;
using std::string;

CreateLinkRequest JsonMapper::parseCreateRequest(const string &body) {
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        throw RegistryError(ErrorCode::InvalidUrl, "Request body must be a JSON object with a 'url' field");
    }

    CreateLinkRequest request;

    auto url = parsed.find("url");
    if (url == parsed.end() || !url->is_string()) {
        throw RegistryError(ErrorCode::InvalidUrl, "Missing 'url' in request body");
    }
    request.url = url->get<string>();

    // JSON null means the optional field was omitted
    auto validity = parsed.find("validity");
    if (validity != parsed.end() && !validity->is_null()) {
        if (!validity->is_number_integer()) {
            throw RegistryError(ErrorCode::InvalidValidity, "Validity must be an integer number of minutes");
        }
        if (validity->is_number_unsigned()) {
            auto minutes = validity->get<std::uint64_t>();
            if (minutes > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
                throw RegistryError(ErrorCode::InvalidValidity, "Validity is out of range");
            }
            request.validity = static_cast<int>(minutes);
        } else {
            auto minutes = validity->get<std::int64_t>();
            if (minutes < std::numeric_limits<int>::min() || minutes > std::numeric_limits<int>::max()) {
                throw RegistryError(ErrorCode::InvalidValidity, "Validity is out of range");
            }
            request.validity = static_cast<int>(minutes);
        }
    }

    auto shortcode = parsed.find("shortcode");
    if (shortcode != parsed.end() && !shortcode->is_null()) {
        if (!shortcode->is_string()) {
            throw RegistryError(ErrorCode::InvalidCode, "Shortcode must be a string");
        }
        request.shortcode = shortcode->get<string>();
    }
    return request;
}

json JsonMapper::createdLink(const LinkRecord &record, const string &baseUrl) {
    string prefix = baseUrl;
    if (!prefix.empty() && prefix.back() != '/') {
        prefix += "/";
    }
    return json{
        {"shortLink", prefix + record.shortcode},
        {"expiry", toIso8601(record.expires_at)}
    };
}

json JsonMapper::clickEvent(const ClickEvent &click) {
    return json{
        {"timestamp", toIso8601(click.timestamp)},
        {"source", click.source},
        {"user_agent", click.user_agent},
        {"ip", click.ip},
        {"geographical_info", click.geo}
    };
}

json JsonMapper::linkStats(const LinkStats &stats) {
    json clicks = json::array();
    for (const auto &click : stats.clicks) {
        clicks.push_back(clickEvent(click));
    }
    return json{
        {"shortcode", stats.shortcode},
        {"original_url", stats.original_url},
        {"total_clicks", stats.total_clicks},
        {"created_at", toIso8601(stats.created_at)},
        {"expiry", toIso8601(stats.expires_at)},
        {"clicks_data", clicks},
        {"is_expired", stats.is_expired}
    };
}

json JsonMapper::errorDetail(const string &message) {
    return json{{"detail", message}};
}
