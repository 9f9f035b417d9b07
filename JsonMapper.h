#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "Modals/ClickEvent.h"
#include "Modals/CreateLinkRequest.h"
#include "Modals/LinkRecord.h"
#include "Modals/LinkStats.h"

// Request decoding and response encoding for the HTTP surface
class JsonMapper {
public:
    /// Decodes a POST /shorturls body. Type errors surface as RegistryError:
    /// bad JSON or url -> InvalidUrl, validity -> InvalidValidity, shortcode -> InvalidCode.
    static CreateLinkRequest parseCreateRequest(const std::string &body);

    static nlohmann::json createdLink(const LinkRecord &record, const std::string &baseUrl);
    static nlohmann::json clickEvent(const ClickEvent &click);
    static nlohmann::json linkStats(const LinkStats &stats);
    static nlohmann::json errorDetail(const std::string &message);
};
