#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "CodeGenerator.h"
#include "Config.h"
#include "RegistryError.h"

// --- DTO Headers ---
#include "Modals/ClickEvent.h"
#include "Modals/LinkRecord.h"

/**
 * @brief In-memory store of short code -> link record mappings.
 *
 * One shared instance serves all request workers. The mapping is guarded by a
 * reader/writer lock so that the existence check and the insert of a create are
 * a single step; each record carries its own mutex for the click log, so clicks
 * on unrelated codes never contend. Records are never removed: expiry is
 * evaluated against the clock on every read.
 */
class LinkRegistry {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit LinkRegistry(CodeGenerator& generator,
                          Clock clock = [] { return std::chrono::system_clock::now(); },
                          int defaultValidityMinutes = Config::DEFAULT_VALIDITY_MINUTES);

    LinkRegistry(const LinkRegistry&) = delete;
    LinkRegistry& operator=(const LinkRegistry&) = delete;

    // --- Link Creation & Retrieval ---

    /// Throws RegistryError with InvalidUrl, InvalidValidity, InvalidCode or CodeTaken.
    LinkRecord create(const std::string& url,
                      std::optional<int> validityMinutes = std::nullopt,
                      const std::optional<std::string>& requestedCode = std::nullopt);

    /// Snapshot of the record including its click log. Throws NotFound.
    LinkRecord get(const std::string& code) const;

    /// Expiry instant of a record, without touching its click log. Throws NotFound.
    std::chrono::system_clock::time_point expiresAt(const std::string& code) const;

    // --- Link Analytics (Click Tracking) ---

    /// Stamps the event with the registry clock and appends it to the record's
    /// click log without copying the log. Returns the destination URL.
    /// Throws NotFound or Expired.
    std::string recordClick(const std::string& code, ClickEvent event);

    std::size_t size() const;
    std::chrono::system_clock::time_point now() const { return clock(); }

    // --- Validation Helpers ---
    static bool isValidUrl(const std::string& url);
    static bool isValidShortCode(const std::string& code);
    /// Codes that would be shadowed by a fixed route (`/health`, `/shorturls`).
    static bool isReservedCode(const std::string& code);

private:
    struct Entry {
        LinkRecord record;          // Only `clicks` changes after insert
        mutable std::mutex clicksMutex;
    };

    std::shared_ptr<Entry> findEntry(const std::string& code) const;
    std::chrono::minutes resolveValidity(std::optional<int> validityMinutes) const;

    CodeGenerator& generator;
    Clock clock;
    int defaultValidityMinutes;

    mutable std::shared_mutex mapMutex;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries;
};
