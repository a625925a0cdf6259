#pragma once

#include "jwtkit/jwk.hpp"
#include "jwtkit/jwt.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace jwtkit {

/// A collection of keys a verifier picks from by key id
class KeySet {
public:
    virtual ~KeySet() = default;

    /// Return the key matching kid
    /// @throws Error (Key) if no key matches
    [[nodiscard]] virtual Jwk select(const std::optional<std::string>& kid) const = 0;

    /// Reload the keys from their source, replacing the whole set at once
    /// @throws Error (Connection) if the source cannot be reached
    virtual void refresh() = 0;
};

/**
 * RFC 7517 key set ({"keys": [...]}) loaded from a URL.
 *
 * The transport is supplied by the caller: the fetcher receives the URL
 * and returns the response body. refresh() swaps the key list in one step,
 * so concurrent select() calls see either the old or the new set.
 */
class JwkSet : public KeySet {
public:
    using Fetcher = std::function<std::string(const std::string& url)>;

    JwkSet(std::string url, Fetcher fetcher);

    /// Key set with a fixed list of keys and no fetcher
    explicit JwkSet(std::vector<Jwk> keys);

    [[nodiscard]] Jwk select(const std::optional<std::string>& kid) const override;
    void refresh() override;

    /// Replace the keys directly
    void replace(std::vector<Jwk> keys);

    [[nodiscard]] const std::string& url() const { return url_; }
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::vector<Jwk> keys() const;

    /// Parse a {"keys": [...]} document. Keys of an unsupported type are skipped.
    /// @throws Error (Invalid) if the document is not a key set
    [[nodiscard]] static std::vector<Jwk> parseKeys(std::string_view json);

private:
    using KeyList = std::vector<Jwk>;

    std::string url_;
    Fetcher fetcher_;
    mutable std::shared_mutex mutex_;
    std::shared_ptr<const KeyList> keys_;
};

/// Decode a token, pick the key named by its "kid" header from keys and verify
template <typename T = json>
[[nodiscard]] Jwt<T> verify(std::string_view token, const KeySet& keys) {
    auto decoded = detail::decodeToken(token);
    return verify<T>(token, keys.select(decoded.header.kid));
}

} // namespace jwtkit
