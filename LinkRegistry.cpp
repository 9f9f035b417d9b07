#include "LinkRegistry.h"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <regex>
#include <utility>

using std::string;
using std::shared_lock;
using std::unique_lock;
using std::lock_guard;

namespace {

// scheme://[userinfo@]host[:port][/path][?query][#fragment], http(s) only
const std::regex ABSOLUTE_URL_PATTERN(
    R"(^https?://([^\s/?#@]+@)?([A-Za-z0-9](?:[A-Za-z0-9-]*[A-Za-z0-9])?(?:\.[A-Za-z0-9](?:[A-Za-z0-9-]*[A-Za-z0-9])?)*|\[[0-9A-Fa-f:.]+\])(:[0-9]{1,5})?([/?#][^\s]*)?$)",
    std::regex::ECMAScript | std::regex::icase);

// Fixed GET routes that take precedence over /<code>
const char* const RESERVED_CODES[] = {"health", "shorturls"};

} // namespace

LinkRegistry::LinkRegistry(CodeGenerator& generator, Clock clock, int defaultValidityMinutes)
    : generator(generator), clock(std::move(clock)), defaultValidityMinutes(defaultValidityMinutes) {}

bool LinkRegistry::isValidUrl(const string& url) {
    if (url.empty() || url.size() > Config::MAX_URL_LENGTH) {
        return false;
    }
    return std::regex_match(url, ABSOLUTE_URL_PATTERN);
}

bool LinkRegistry::isValidShortCode(const string& code) {
    if (code.size() < Config::MIN_CUSTOM_CODE_LENGTH) {
        return false;
    }
    return std::all_of(code.begin(), code.end(), [](unsigned char c) {
        return std::isalnum(c) != 0;
    });
}

bool LinkRegistry::isReservedCode(const string& code) {
    return std::find(std::begin(RESERVED_CODES), std::end(RESERVED_CODES), code) != std::end(RESERVED_CODES);
}

std::chrono::minutes LinkRegistry::resolveValidity(std::optional<int> validityMinutes) const {
    if (!validityMinutes) {
        return std::chrono::minutes(defaultValidityMinutes);
    }
    if (*validityMinutes <= 0) {
        throw RegistryError(ErrorCode::InvalidValidity, "Validity must be greater than 0");
    }
    if (*validityMinutes > Config::MAX_VALIDITY_MINUTES) {
        throw RegistryError(ErrorCode::InvalidValidity,
                            "Validity must not exceed " + std::to_string(Config::MAX_VALIDITY_MINUTES) + " minutes");
    }
    return std::chrono::minutes(*validityMinutes);
}

LinkRecord LinkRegistry::create(const string& url,
                                std::optional<int> validityMinutes,
                                const std::optional<string>& requestedCode) {
    if (!isValidUrl(url)) {
        throw RegistryError(ErrorCode::InvalidUrl, "URL must be an absolute http(s) URL with a host");
    }
    std::chrono::minutes validity = resolveValidity(validityMinutes);

    if (requestedCode) {
        if (requestedCode->size() < Config::MIN_CUSTOM_CODE_LENGTH) {
            throw RegistryError(ErrorCode::InvalidCode, "Shortcode must be at least " +
                                std::to_string(Config::MIN_CUSTOM_CODE_LENGTH) + " characters long");
        }
        if (!isValidShortCode(*requestedCode)) {
            throw RegistryError(ErrorCode::InvalidCode, "Shortcode can only contain alphanumeric characters");
        }
        if (isReservedCode(*requestedCode)) {
            throw RegistryError(ErrorCode::InvalidCode, "Shortcode is reserved: " + *requestedCode);
        }
    }

    auto entry = std::make_shared<Entry>();
    entry->record.original_url = url;
    entry->record.created_at = clock();
    entry->record.expires_at = entry->record.created_at + validity;

    if (requestedCode) {
        entry->record.shortcode = *requestedCode;
        unique_lock<std::shared_mutex> lock(mapMutex);
        // Expired records still hold their code
        if (!entries.try_emplace(*requestedCode, entry).second) {
            throw RegistryError(ErrorCode::CodeTaken, "Shortcode already exists: " + *requestedCode);
        }
        return entry->record;
    }

    // Auto-generated code: draw outside the lock, insert-if-absent under it, retry on collision
    while (true) {
        string code = generator.generate();
        if (isReservedCode(code)) {
            continue;
        }
        entry->record.shortcode = code;
        unique_lock<std::shared_mutex> lock(mapMutex);
        if (entries.try_emplace(code, entry).second) {
            return entry->record;
        }
    }
}

std::shared_ptr<LinkRegistry::Entry> LinkRegistry::findEntry(const string& code) const {
    shared_lock<std::shared_mutex> lock(mapMutex);
    auto it = entries.find(code);
    if (it == entries.end()) {
        throw RegistryError(ErrorCode::NotFound, "Short URL not found: " + code);
    }
    return it->second;
}

LinkRecord LinkRegistry::get(const string& code) const {
    std::shared_ptr<Entry> entry = findEntry(code);
    lock_guard<std::mutex> lock(entry->clicksMutex);
    return entry->record;
}

std::chrono::system_clock::time_point LinkRegistry::expiresAt(const string& code) const {
    // expires_at is fixed at insert, so no record lock is needed
    return findEntry(code)->record.expires_at;
}

string LinkRegistry::recordClick(const string& code, ClickEvent event) {
    std::shared_ptr<Entry> entry = findEntry(code);
    lock_guard<std::mutex> lock(entry->clicksMutex);
    // Stamped under the record lock so the log stays in arrival order and no click lands after expires_at
    event.timestamp = clock();
    if (event.timestamp >= entry->record.expires_at) {
        throw RegistryError(ErrorCode::Expired, "Short URL has expired: " + code);
    }
    entry->record.clicks.push_back(std::move(event));
    return entry->record.original_url;
}

std::size_t LinkRegistry::size() const {
    shared_lock<std::shared_mutex> lock(mapMutex);
    return entries.size();
}
