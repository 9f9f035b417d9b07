#pragma once

#include <string>

#include "LinkRegistry.h"
#include "Modals/LinkStats.h"

// Read-only view of a link and its click log
class AnalyticsReporter {
public:
    explicit AnalyticsReporter(const LinkRegistry& registry);

    /// Throws RegistryError with NotFound.
    LinkStats report(const std::string& code) const;

private:
    const LinkRegistry& registry;
};
