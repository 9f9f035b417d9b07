#include "AnalyticsReporter.h"
#include <utility>

AnalyticsReporter::AnalyticsReporter(const LinkRegistry& registry) : registry(registry) {}

LinkStats AnalyticsReporter::report(const std::string& code) const {
    LinkRecord record = registry.get(code);

    LinkStats stats;
    stats.shortcode = std::move(record.shortcode);
    stats.original_url = std::move(record.original_url);
    stats.created_at = record.created_at;
    stats.expires_at = record.expires_at;
    stats.total_clicks = record.clicks.size();
    stats.clicks = std::move(record.clicks);
    stats.is_expired = registry.now() >= stats.expires_at;
    return stats;
}
