#pragma once

#include <chrono>
#include <string>

struct ClickEvent {
    std::chrono::system_clock::time_point timestamp;
    std::string source;        // Referrer, or "direct" when the request carried none
    std::string user_agent;    // May be empty
    std::string ip;
    std::string geo;           // Coarse location, "Unknown Location" when unresolvable
};
