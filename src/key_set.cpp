#include "jwtkit/key_set.hpp"
#include "jwtkit/error.hpp"
#include "jwtkit/log.hpp"
#include <mutex>

namespace jwtkit {

JwkSet::JwkSet(std::string url, Fetcher fetcher)
    : url_(std::move(url)),
      fetcher_(std::move(fetcher)),
      keys_(std::make_shared<const KeyList>()) {}

JwkSet::JwkSet(std::vector<Jwk> keys)
    : keys_(std::make_shared<const KeyList>(std::move(keys))) {}

Jwk JwkSet::select(const std::optional<std::string>& kid) const {
    std::shared_ptr<const KeyList> keys;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        keys = keys_;
    }

    if (kid) {
        for (const auto& key : *keys) {
            if (key.kid() == kid) {
                return key;
            }
        }
    } else if (keys->size() == 1) {
        // No kid in the token: only unambiguous when there is a single key
        return keys->front();
    }

    log::warning("No key in set {} matches kid {}", url_.empty() ? "<static>" : url_,
                 kid.value_or("<none>"));
    throw Error(ErrorKind::Key, "No matching key");
}

void JwkSet::refresh() {
    if (!fetcher_) {
        throw Error(ErrorKind::Connection, "Key set has no source");
    }

    std::string body;
    try {
        body = fetcher_(url_);
    } catch (const std::exception& e) {
        log::warning("Fetching key set {} failed: {}", url_, e.what());
        throw Error(ErrorKind::Connection, "Failed to fetch key set");
    }

    // A malformed document throws here and leaves the current keys in place
    auto keys = parseKeys(body);
    std::size_t count = keys.size();
    replace(std::move(keys));
    log::debug("Refreshed key set {} ({} keys)", url_, count);
}

void JwkSet::replace(std::vector<Jwk> keys) {
    auto next = std::make_shared<const KeyList>(std::move(keys));
    std::unique_lock<std::shared_mutex> lock(mutex_);
    keys_ = std::move(next);
}

std::size_t JwkSet::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return keys_->size();
}

std::vector<Jwk> JwkSet::keys() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return *keys_;
}

std::vector<Jwk> JwkSet::parseKeys(std::string_view text) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::exception& e) {
        log::warning("Key set is not valid JSON: {}", e.what());
        throw Error(ErrorKind::Invalid, "Failed to decode key set");
    }

    auto it = document.is_object() ? document.find("keys") : document.end();
    if (it == document.end() || !it->is_array()) {
        throw Error(ErrorKind::Invalid, "Failed to decode key set");
    }

    std::vector<Jwk> keys;
    std::size_t index = 0;
    for (const auto& entry : *it) {
        try {
            keys.push_back(Jwk::fromJson(entry));
        } catch (const Error& e) {
            // Sets routinely mix key types; skip what this library cannot use
            log::warning("Skipping key {} of key set: {}", index, e.message());
        }
        ++index;
    }
    return keys;
}

} // namespace jwtkit
