#pragma once

#include <chrono>
#include <string>

// ISO-8601 UTC with millisecond precision, e.g. 2026-01-02T03:04:05.678Z
std::string toIso8601(std::chrono::system_clock::time_point tp);

// Local wall-clock time for log lines (YYYY-MM-DD HH:MM:SS)
std::string getCurrentTimestamp();
