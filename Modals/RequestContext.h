#pragma once

#include <string>

// Client metadata observed by the HTTP layer for one redirect request
struct RequestContext {
    std::string referrer;
    std::string userAgent;
    std::string ip;
};
