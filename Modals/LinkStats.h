#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "ClickEvent.h"

struct LinkStats {
    std::string shortcode;
    std::string original_url;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point expires_at;
    std::size_t total_clicks = 0;
    std::vector<ClickEvent> clicks;
    bool is_expired = false;
};
