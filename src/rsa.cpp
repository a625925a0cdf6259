#include "rsa.hpp"
#include "jwtkit/error.hpp"
#include "jwtkit/log.hpp"
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/param_build.h>
#include <openssl/rsa.h>

namespace jwtkit::internal {

namespace {
    struct BignumDeleter {
        void operator()(BIGNUM* bn) const { BN_clear_free(bn); }
    };
    struct BnCtxDeleter {
        void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
    };
    struct ParamBldDeleter {
        void operator()(OSSL_PARAM_BLD* bld) const { OSSL_PARAM_BLD_free(bld); }
    };
    struct ParamDeleter {
        void operator()(OSSL_PARAM* params) const { OSSL_PARAM_free(params); }
    };
    struct PkeyCtxDeleter {
        void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
    };
    struct MdCtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };

    using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;
    using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
    using ParamBldPtr = std::unique_ptr<OSSL_PARAM_BLD, ParamBldDeleter>;
    using ParamPtr = std::unique_ptr<OSSL_PARAM, ParamDeleter>;
    using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
    using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

    [[noreturn]] void rejectKey(const char* what) {
        log::warning("RSA key rejected ({}): {}", what, opensslError());
        throw Error(ErrorKind::Invalid, "Invalid RSA key material");
    }

    BignumPtr toBignum(const std::vector<std::uint8_t>& bytes) {
        BignumPtr bn(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr));
        if (!bn) {
            rejectKey("BN_bin2bn");
        }
        return bn;
    }

    BignumPtr newBignum() {
        BignumPtr bn(BN_secure_new());
        if (!bn) {
            rejectKey("BN_secure_new");
        }
        return bn;
    }

    // d mod (factor - 1)
    BignumPtr crtExponent(const BIGNUM* d, const BIGNUM* factor, BN_CTX* ctx) {
        auto factorMinusOne = newBignum();
        auto result = newBignum();
        if (BN_sub(factorMinusOne.get(), factor, BN_value_one()) != 1 ||
            BN_mod(result.get(), d, factorMinusOne.get(), ctx) != 1) {
            rejectKey("CRT exponent");
        }
        return result;
    }

    EvpPkeyPtr fromParams(OSSL_PARAM_BLD* bld, int selection) {
        ParamPtr params(OSSL_PARAM_BLD_to_param(bld));
        if (!params) {
            rejectKey("OSSL_PARAM_BLD_to_param");
        }

        PkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr));
        if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
            rejectKey("EVP_PKEY_fromdata_init");
        }

        EVP_PKEY* raw = nullptr;
        if (EVP_PKEY_fromdata(ctx.get(), &raw, selection, params.get()) != 1 || raw == nullptr) {
            rejectKey("EVP_PKEY_fromdata");
        }
        return EvpPkeyPtr(raw);
    }

    void requireModulusAndExponent(const RsaComponents& components) {
        if (components.n.empty() || components.e.empty()) {
            throw Error(ErrorKind::Invalid, "Invalid RSA key material");
        }
    }
}

std::string opensslError() {
    std::string result;
    while (unsigned long code = ERR_get_error()) {
        char buf[256] = {0};
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!result.empty()) {
            result += "; ";
        }
        result += buf;
    }
    return result.empty() ? "no OpenSSL error reported" : result;
}

EvpPkeyPtr buildRsaPublicKey(const RsaComponents& components) {
    requireModulusAndExponent(components);
    auto n = toBignum(components.n);
    auto e = toBignum(components.e);

    ParamBldPtr bld(OSSL_PARAM_BLD_new());
    if (!bld ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_N, n.get()) != 1 ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_E, e.get()) != 1) {
        rejectKey("OSSL_PARAM_BLD_push_BN (n, e)");
    }
    return fromParams(bld.get(), EVP_PKEY_PUBLIC_KEY);
}

EvpPkeyPtr buildRsaPrivateKey(const RsaComponents& components) {
    requireModulusAndExponent(components);
    if (components.d.empty() || components.p.empty() || components.q.empty()) {
        throw Error(ErrorKind::Invalid, "Invalid RSA key material");
    }

    auto n = toBignum(components.n);
    auto e = toBignum(components.e);
    auto d = toBignum(components.d);
    auto p = toBignum(components.p);
    auto q = toBignum(components.q);

    BnCtxPtr ctx(BN_CTX_new());
    if (!ctx) {
        rejectKey("BN_CTX_new");
    }

    // OpenSSL 3.0 needs the CRT helpers; JWKs may omit them
    auto dp = components.dp.empty() ? crtExponent(d.get(), p.get(), ctx.get())
                                    : toBignum(components.dp);
    auto dq = components.dq.empty() ? crtExponent(d.get(), q.get(), ctx.get())
                                    : toBignum(components.dq);
    BignumPtr qi;
    if (components.qi.empty()) {
        qi = newBignum();
        if (BN_mod_inverse(qi.get(), q.get(), p.get(), ctx.get()) == nullptr) {
            rejectKey("BN_mod_inverse");
        }
    } else {
        qi = toBignum(components.qi);
    }

    ParamBldPtr bld(OSSL_PARAM_BLD_new());
    if (!bld ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_N, n.get()) != 1 ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_E, e.get()) != 1 ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_D, d.get()) != 1 ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_FACTOR1, p.get()) != 1 ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_FACTOR2, q.get()) != 1 ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_EXPONENT1, dp.get()) != 1 ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_EXPONENT2, dq.get()) != 1 ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_COEFFICIENT1, qi.get()) != 1) {
        rejectKey("OSSL_PARAM_BLD_push_BN (d, p, q, dp, dq, qi)");
    }
    return fromParams(bld.get(), EVP_PKEY_KEYPAIR);
}

std::vector<std::uint8_t> rs256Sign(EVP_PKEY* key, std::span<const std::uint8_t> message) {
    auto fail = [](const char* what) -> Error {
        log::error("RS256 signing failed ({}): {}", what, opensslError());
        return Error(ErrorKind::Internal, "Sign message");
    };

    MdCtxPtr ctx(EVP_MD_CTX_new());
    EVP_PKEY_CTX* pctx = nullptr;
    if (!ctx || EVP_DigestSignInit(ctx.get(), &pctx, EVP_sha256(), nullptr, key) != 1) {
        throw fail("EVP_DigestSignInit");
    }
    if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PADDING) != 1) {
        throw fail("EVP_PKEY_CTX_set_rsa_padding");
    }

    size_t length = 0;
    if (EVP_DigestSign(ctx.get(), nullptr, &length, message.data(), message.size()) != 1) {
        throw fail("EVP_DigestSign (length)");
    }
    std::vector<std::uint8_t> signature(length);
    if (EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(), message.size()) != 1) {
        throw fail("EVP_DigestSign");
    }
    signature.resize(length);
    return signature;
}

bool rs256Verify(EVP_PKEY* key,
                 std::span<const std::uint8_t> message,
                 std::span<const std::uint8_t> signature) {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    EVP_PKEY_CTX* pctx = nullptr;
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), &pctx, EVP_sha256(), nullptr, key) != 1 ||
        EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PADDING) != 1) {
        log::error("RS256 verification setup failed: {}", opensslError());
        return false;
    }

    int rc = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                              message.data(), message.size());
    if (rc != 1) {
        // Mismatch or malformed signature; keep the queue clean for the next call
        ERR_clear_error();
        return false;
    }
    return true;
}

} // namespace jwtkit::internal
