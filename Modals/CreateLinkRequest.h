#pragma once

#include <optional>
#include <string>

// Body of POST /shorturls after JSON decoding; ranges are checked by the registry
struct CreateLinkRequest {
    std::string url;
    std::optional<int> validity;          // Minutes
    std::optional<std::string> shortcode;
};
