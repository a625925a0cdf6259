#include "jwtkit/jwk.hpp"
#include "jwtkit/error.hpp"
#include "jwtkit/jwt_constants.hpp"
#include "jwtkit/log.hpp"
#include "base64url.hpp"
#include "rsa.hpp"

namespace jwtkit {

namespace {
    template <class... Ts>
    struct overloaded : Ts... {
        using Ts::operator()...;
    };
    template <class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    [[noreturn]] void invalidKey(const char* message) {
        throw Error(ErrorKind::Invalid, message);
    }

    std::optional<std::string> optionalString(const json& object, const char* member) {
        auto it = object.find(member);
        if (it == object.end() || it->is_null()) {
            return std::nullopt;
        }
        if (!it->is_string()) {
            log::warning("JWK member '{}' is not a string", member);
            invalidKey("Failed to decode key");
        }
        return it->get<std::string>();
    }

    std::string requiredString(const json& object, const char* member) {
        auto value = optionalString(object, member);
        if (!value || value->empty()) {
            log::warning("JWK is missing required member '{}'", member);
            invalidKey("Failed to decode key");
        }
        return *value;
    }

    // key_ops is a list; x5c is a list in RFC 7517 but older producers emit a string
    std::optional<std::vector<std::string>> optionalStringList(const json& object,
                                                               const char* member,
                                                               bool acceptString) {
        auto it = object.find(member);
        if (it == object.end() || it->is_null()) {
            return std::nullopt;
        }
        if (acceptString && it->is_string()) {
            return std::vector<std::string>{it->get<std::string>()};
        }
        if (!it->is_array()) {
            log::warning("JWK member '{}' is not a list", member);
            invalidKey("Failed to decode key");
        }

        std::vector<std::string> values;
        for (const auto& item : *it) {
            if (!item.is_string()) {
                log::warning("JWK member '{}' holds a non-string entry", member);
                invalidKey("Failed to decode key");
            }
            values.push_back(item.get<std::string>());
        }
        return values;
    }

    std::vector<std::uint8_t> decodeParameter(const std::string& value, const char* member) {
        try {
            return internal::base64url_decode(value);
        } catch (const Error& e) {
            log::warning("JWK parameter '{}' is not base64url: {}", member, e.message());
            invalidKey("Failed to decode key");
        }
    }

    std::vector<std::uint8_t> decodeOptional(const std::optional<std::string>& value,
                                             const char* member) {
        return value ? decodeParameter(*value, member) : std::vector<std::uint8_t>{};
    }
}

class Jwk::Impl {
public:
    std::string kty_;
    std::optional<std::string> kid_;
    std::optional<std::string> alg_;
    std::optional<std::vector<std::string>> keyOps_;
    std::optional<std::string> x5u_;
    std::optional<std::vector<std::string>> x5c_;
    std::optional<std::string> x5t_;
    std::optional<std::string> x5tS256_;
    KeyBody body_;
    std::shared_ptr<EVP_PKEY> key_;
};

Jwk::Jwk(std::shared_ptr<const Impl> impl) : impl_(std::move(impl)) {}

Jwk Jwk::parse(std::string_view text) {
    json object;
    try {
        object = json::parse(text);
    } catch (const json::exception& e) {
        log::warning("JWK is not valid JSON: {}", e.what());
        invalidKey("Failed to decode key");
    }
    return fromJson(object);
}

Jwk Jwk::fromJson(const json& object) {
    if (!object.is_object()) {
        invalidKey("Failed to decode key");
    }

    auto impl = std::make_shared<Impl>();
    impl->kty_ = requiredString(object, "kty");
    if (impl->kty_ != KTY_RSA) {
        log::warning("Unsupported JWK key type '{}'", impl->kty_);
        invalidKey("Unsupported key type");
    }

    impl->kid_ = optionalString(object, "kid");
    impl->alg_ = optionalString(object, "alg");
    if (impl->alg_ && *impl->alg_ != ALG_RS256) {
        log::warning("Unsupported JWK algorithm '{}'", *impl->alg_);
        invalidKey("Unsupported key algorithm");
    }
    impl->keyOps_ = optionalStringList(object, "key_ops", false);
    impl->x5u_ = optionalString(object, "x5u");
    impl->x5c_ = optionalStringList(object, "x5c", true);
    impl->x5t_ = optionalString(object, "x5t");
    impl->x5tS256_ = optionalString(object, "x5t#S256");

    internal::RsaComponents components;
    std::string n = requiredString(object, "n");
    std::string e = requiredString(object, "e");
    components.n = decodeParameter(n, "n");
    components.e = decodeParameter(e, "e");

    auto d = optionalString(object, "d");
    if (d && !d->empty()) {
        RsaPrivate body;
        body.n = std::move(n);
        body.e = std::move(e);
        body.d = std::move(*d);
        body.p = requiredString(object, "p");
        body.q = requiredString(object, "q");
        body.dp = optionalString(object, "dp");
        body.dq = optionalString(object, "dq");
        body.qi = optionalString(object, "qi");

        components.d = decodeParameter(body.d, "d");
        components.p = decodeParameter(body.p, "p");
        components.q = decodeParameter(body.q, "q");
        components.dp = decodeOptional(body.dp, "dp");
        components.dq = decodeOptional(body.dq, "dq");
        components.qi = decodeOptional(body.qi, "qi");

        impl->key_ = internal::buildRsaPrivateKey(components);
        impl->body_ = std::move(body);
    } else {
        impl->key_ = internal::buildRsaPublicKey(components);
        impl->body_ = RsaPublic{std::move(n), std::move(e)};
    }

    log::debug("Parsed {} RSA JWK (kid: {})",
               impl->body_.index() == 1 ? "private" : "public",
               impl->kid_.value_or("<none>"));
    return Jwk(std::move(impl));
}

const std::string& Jwk::kty() const { return impl_->kty_; }
const std::optional<std::string>& Jwk::kid() const { return impl_->kid_; }
const std::optional<std::vector<std::string>>& Jwk::keyOps() const { return impl_->keyOps_; }
const std::optional<std::string>& Jwk::x5u() const { return impl_->x5u_; }
const std::optional<std::vector<std::string>>& Jwk::x5c() const { return impl_->x5c_; }
const std::optional<std::string>& Jwk::x5t() const { return impl_->x5t_; }
const std::optional<std::string>& Jwk::x5tS256() const { return impl_->x5tS256_; }
const KeyBody& Jwk::body() const { return impl_->body_; }

std::string Jwk::alg() const {
    if (impl_->alg_) {
        return *impl_->alg_;
    }
    return std::visit(overloaded{
        [](const RsaPublic&) { return std::string(ALG_RS256); },
        [](const RsaPrivate&) { return std::string(ALG_RS256); },
    }, impl_->body_);
}

bool Jwk::isPrivate() const {
    return std::holds_alternative<RsaPrivate>(impl_->body_);
}

Jwk Jwk::publicKey() const {
    if (!isPrivate()) {
        return *this;
    }

    const auto& priv = std::get<RsaPrivate>(impl_->body_);
    auto impl = std::make_shared<Impl>(*impl_);
    impl->body_ = RsaPublic{priv.n, priv.e};

    internal::RsaComponents components;
    components.n = internal::base64url_decode(priv.n);
    components.e = internal::base64url_decode(priv.e);
    impl->key_ = internal::buildRsaPublicKey(components);
    return Jwk(std::move(impl));
}

void Jwk::verify(std::span<const std::uint8_t> message,
                 std::span<const std::uint8_t> signature) const {
    // A private key verifies with its (n, e) half
    bool valid = std::visit(overloaded{
        [&](const RsaPublic&) { return internal::rs256Verify(impl_->key_.get(), message, signature); },
        [&](const RsaPrivate&) { return internal::rs256Verify(impl_->key_.get(), message, signature); },
    }, impl_->body_);

    if (!valid) {
        log::warning("Signature does not match key (kid: {})", impl_->kid_.value_or("<none>"));
        throw Error(ErrorKind::Certificate, "Signature does not match certificate");
    }
}

std::vector<std::uint8_t> Jwk::sign(std::span<const std::uint8_t> message) const {
    return std::visit(overloaded{
        [](const RsaPublic&) -> std::vector<std::uint8_t> {
            throw Error(ErrorKind::Invalid, "Key doesn't support signing");
        },
        [&](const RsaPrivate&) {
            return internal::rs256Sign(impl_->key_.get(), message);
        },
    }, impl_->body_);
}

json Jwk::toJsonObject() const {
    json object;
    object["kty"] = impl_->kty_;
    if (impl_->kid_) object["kid"] = *impl_->kid_;
    if (impl_->alg_) object["alg"] = *impl_->alg_;
    if (impl_->keyOps_) object["key_ops"] = *impl_->keyOps_;
    if (impl_->x5u_) object["x5u"] = *impl_->x5u_;
    if (impl_->x5c_) object["x5c"] = *impl_->x5c_;
    if (impl_->x5t_) object["x5t"] = *impl_->x5t_;
    if (impl_->x5tS256_) object["x5t#S256"] = *impl_->x5tS256_;

    std::visit(overloaded{
        [&](const RsaPublic& key) {
            object["n"] = key.n;
            object["e"] = key.e;
        },
        [&](const RsaPrivate& key) {
            object["n"] = key.n;
            object["e"] = key.e;
            object["d"] = key.d;
            object["p"] = key.p;
            object["q"] = key.q;
            if (key.dp) object["dp"] = *key.dp;
            if (key.dq) object["dq"] = *key.dq;
            if (key.qi) object["qi"] = *key.qi;
        },
    }, impl_->body_);
    return object;
}

std::string Jwk::toJson() const {
    return toJsonObject().dump();
}

bool operator==(const Jwk& lhs, const Jwk& rhs) {
    const auto& a = *lhs.impl_;
    const auto& b = *rhs.impl_;
    return a.kty_ == b.kty_ && a.kid_ == b.kid_ && a.alg_ == b.alg_ &&
           a.keyOps_ == b.keyOps_ && a.x5u_ == b.x5u_ && a.x5c_ == b.x5c_ &&
           a.x5t_ == b.x5t_ && a.x5tS256_ == b.x5tS256_ && a.body_ == b.body_;
}

} // namespace jwtkit
