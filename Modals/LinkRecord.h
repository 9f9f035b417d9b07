#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "ClickEvent.h"

struct LinkRecord {
    std::string shortcode;
    std::string original_url;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point expires_at;   // created_at + validity
    std::vector<ClickEvent> clicks;                     // Append-only, arrival order
};
