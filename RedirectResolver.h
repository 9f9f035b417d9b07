#pragma once

#include <string>

#include "GeoLocator.h"
#include "LinkRegistry.h"
#include "Modals/RequestContext.h"

/**
 * @brief Turns a short code into its target URL and records the click.
 *
 * The click is appended synchronously before resolve() returns, at a cost
 * independent of how many clicks the link already has. A failing geo lookup
 * is logged and the click is kept with an "Unknown Location" geo.
 */
class RedirectResolver {
public:
    RedirectResolver(LinkRegistry& registry, GeoLocator& geoLocator);

    /// Throws RegistryError with NotFound or Expired.
    std::string resolve(const std::string& code, const RequestContext& context);

private:
    ClickEvent buildClickEvent(const RequestContext& context);

    LinkRegistry& registry;
    GeoLocator& geoLocator;
};
