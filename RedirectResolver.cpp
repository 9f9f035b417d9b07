#include "RedirectResolver.h"
#include "Logger.h"
#include <exception>
#include <utility>

RedirectResolver::RedirectResolver(LinkRegistry& registry, GeoLocator& geoLocator)
    : registry(registry), geoLocator(geoLocator) {}

ClickEvent RedirectResolver::buildClickEvent(const RequestContext& context) {
    ClickEvent event;
    event.source = context.referrer.empty() ? "direct" : context.referrer;
    event.user_agent = context.userAgent;
    event.ip = context.ip;
    try {
        event.geo = geoLocator.lookup(context.ip);
    } catch (const std::exception& e) {
        SaveLogs::log_exception("RedirectResolver::buildClickEvent", std::string("Geo lookup failed: ") + e.what());
        event.geo = GeoLocator::UNKNOWN_LOCATION;
    }
    return event;
}

std::string RedirectResolver::resolve(const std::string& code, const RequestContext& context) {
    // Unknown and expired codes are rejected before any geo lookup is spent on them
    if (registry.now() >= registry.expiresAt(code)) {
        throw RegistryError(ErrorCode::Expired, "Short URL has expired: " + code);
    }

    // recordClick re-checks expiry under the record lock; its NotFound/Expired propagate
    return registry.recordClick(code, buildClickEvent(context));
}
