#pragma once

#include "jwtkit/json.hpp"
#include <cstdint>
#include <string>

namespace fixtures {

// 2048-bit RSA key, kid "test"
inline constexpr const char* RS256_PRIVATE_KEY = R"({
    "kty": "RSA",
    "kid": "test",
    "alg": "RS256",
    "n": "liMW7uxnzq8KejzQA1YC-Zk9lrV3NI3wB49pIMtzlOYwDvZOl_BbfigSCJU-8wBONAZ5is3-Ww_kOuE6KCqhGL0wSPvs5Wv7TrN_ZQNZtkM9WbJC3nIXTlLycXWFh2kh3_B0H5D4Jiz9eXZO2G1AljRkTf18K6Ep-dyJSqM8YYBxQBlE2tmhCWf-S7Zq0exwzJXeOtJ8tCvY-L25dIOBEJ7lh_FQ05iSVE1AL_PYeGKuo8oYXHvt8VUFznD4d1B9NSipmiKZuQAbbrH4Oyq-TPb0_twq2WtvN4iBCmnOosgRzmMpm2yuJ-d2kTcF8ELbJFZgVtlD1wpnO3BumrtOnQ",
    "e": "AQAB",
    "d": "hCDlcedDhDWv9tvGBOmRPLCL7zJMckfn0f93-ZCTa5sY-FHz4Ot62Y_SLxOJjrnaGRcJqAqZqvJVXSwRzn-Vvvvgnpp3ZYCebiiyGOfV7_1E5Mdo6fNmZ1vAWfGfTghL85Td3VnryU0W1eo0gWvEx2vcSnam7I6tLmPTv4fg_7x8Uw5DeIXiq-qd8sJmBOmOXaymdRTGHxC5U-KfxXbz61-i0F099SvvSBOhY6joGlBqoxHnGlq94bjcCOwSG-cKf1gJu7mWr6EJZYHqI271S-Xn_PolHH0QzFNszQm9fMD0eQF7tJv6gchPupa2Wd5nsLsHV11hfbxc6sVmV3oLAQ",
    "p": "z0efhRpEUlBIlQyT2xhYrXhZHIDZs2oxOM1MpRcwdOPW1qo4fG7JrbIQ2kQepLY6zK-SssBw4KdcUhG_OuDcx-uIr6LUf0VHp0Af1ieyiceXexuBQw8URzyVCg9e8kFICHshyz6dVqS5Y1OM8kIS5l1WkYlSx7NFU0K-jo-CSK0",
    "q": "uW0XqavXEr2uCpMF1Nh9SgjkaRbLhCd8x_RZpTRDpf0BqUaUNbrtF1udK6weuVh6xgLKUoE1SdjUHs5AvQmVd14aKDeYu19AQJgfnn4Y6hB2zkwYp5jCuV1PJKteC-p7XJERO8ABQNURe-PRBpfHKb4Ohp7qvW0oeQ0DZfF6K7E",
    "dp": "CAO28UiQt7YO-GRiGyiX1S1AFNAOmtdSS-X0PrXk08AzgF1Yjcci2Sp3aFkV7jx1jZCEVZEHTEhsU2gIQtiK8Nf0kwXyvXEKUjcyg-9JAfbLrqDjoJomqJJ5GMh7XVaU2G8aYWdsYftAh8ylOIDBhlK5lCsBHmOaHJwKDi0SVok",
    "dq": "hrl15OifBtXcW4CBTynQtncJhjVyv111c07dx4PW1waiK1zFmNhtJXiCFNYlKKPZ6H7kg9evYS1yycMwFGmfOLCdrrTeet11MLmW17Bk58P4nmF51GPQr5_VPh5o4Z2H7jTU4aXbA0EMSAi5ueGTaofVxAg5JFLogjNrUamHC7E",
    "qi": "F1QMnwPd4nEKPQdwMIVs9dmD03FPQKaC2yUx_SD2BN5hLNmMy89jwa7BcwDum5ZyN22wT6JOEc7FC-tA3-0j88VvIyihdgjFJWtpUpbvUq_1ehVwh3gc17YJm27xBYKwlFmpQLVWG4wg1h52mXlZR_9L6cNf6H4CTDFft26RxUc"
})";

// Same key without the CRT helpers
inline constexpr const char* RS256_PRIVATE_KEY_NO_CRT = R"({
    "kty": "RSA",
    "kid": "test",
    "n": "liMW7uxnzq8KejzQA1YC-Zk9lrV3NI3wB49pIMtzlOYwDvZOl_BbfigSCJU-8wBONAZ5is3-Ww_kOuE6KCqhGL0wSPvs5Wv7TrN_ZQNZtkM9WbJC3nIXTlLycXWFh2kh3_B0H5D4Jiz9eXZO2G1AljRkTf18K6Ep-dyJSqM8YYBxQBlE2tmhCWf-S7Zq0exwzJXeOtJ8tCvY-L25dIOBEJ7lh_FQ05iSVE1AL_PYeGKuo8oYXHvt8VUFznD4d1B9NSipmiKZuQAbbrH4Oyq-TPb0_twq2WtvN4iBCmnOosgRzmMpm2yuJ-d2kTcF8ELbJFZgVtlD1wpnO3BumrtOnQ",
    "e": "AQAB",
    "d": "hCDlcedDhDWv9tvGBOmRPLCL7zJMckfn0f93-ZCTa5sY-FHz4Ot62Y_SLxOJjrnaGRcJqAqZqvJVXSwRzn-Vvvvgnpp3ZYCebiiyGOfV7_1E5Mdo6fNmZ1vAWfGfTghL85Td3VnryU0W1eo0gWvEx2vcSnam7I6tLmPTv4fg_7x8Uw5DeIXiq-qd8sJmBOmOXaymdRTGHxC5U-KfxXbz61-i0F099SvvSBOhY6joGlBqoxHnGlq94bjcCOwSG-cKf1gJu7mWr6EJZYHqI271S-Xn_PolHH0QzFNszQm9fMD0eQF7tJv6gchPupa2Wd5nsLsHV11hfbxc6sVmV3oLAQ",
    "p": "z0efhRpEUlBIlQyT2xhYrXhZHIDZs2oxOM1MpRcwdOPW1qo4fG7JrbIQ2kQepLY6zK-SssBw4KdcUhG_OuDcx-uIr6LUf0VHp0Af1ieyiceXexuBQw8URzyVCg9e8kFICHshyz6dVqS5Y1OM8kIS5l1WkYlSx7NFU0K-jo-CSK0",
    "q": "uW0XqavXEr2uCpMF1Nh9SgjkaRbLhCd8x_RZpTRDpf0BqUaUNbrtF1udK6weuVh6xgLKUoE1SdjUHs5AvQmVd14aKDeYu19AQJgfnn4Y6hB2zkwYp5jCuV1PJKteC-p7XJERO8ABQNURe-PRBpfHKb4Ohp7qvW0oeQ0DZfF6K7E"
})";

// Public half of the key above
inline constexpr const char* RS256_PUBLIC_KEY = R"({
    "kty": "RSA",
    "kid": "test",
    "n": "liMW7uxnzq8KejzQA1YC-Zk9lrV3NI3wB49pIMtzlOYwDvZOl_BbfigSCJU-8wBONAZ5is3-Ww_kOuE6KCqhGL0wSPvs5Wv7TrN_ZQNZtkM9WbJC3nIXTlLycXWFh2kh3_B0H5D4Jiz9eXZO2G1AljRkTf18K6Ep-dyJSqM8YYBxQBlE2tmhCWf-S7Zq0exwzJXeOtJ8tCvY-L25dIOBEJ7lh_FQ05iSVE1AL_PYeGKuo8oYXHvt8VUFznD4d1B9NSipmiKZuQAbbrH4Oyq-TPb0_twq2WtvN4iBCmnOosgRzmMpm2yuJ-d2kTcF8ELbJFZgVtlD1wpnO3BumrtOnQ",
    "e": "AQAB"
})";

// jwt.io HS256 example
inline constexpr const char* HS256_TOKEN =
    "eyJhbGciOiJIUzI1NiIsInR5cCI6IkpXVCJ9"
    ".eyJzdWIiOiIxMjM0NTY3ODkwIiwibmFtZSI6IkpvaG4gRG9lIiwiaWF0IjoxNTE2MjM5MDIyfQ"
    ".SflKxwRJSMeKKF2QT4fwpMeJf36POk6yJV_adQssw5c";

// {"alg":"RS256","typ":"JWT","kid":"test"} . {"sub":"1234567890","name":"John Doe","iat":1516239022}
inline constexpr const char* RS256_SIGNED_HEADER = "eyJhbGciOiJSUzI1NiIsInR5cCI6IkpXVCIsImtpZCI6InRlc3QifQ";
inline constexpr const char* CLAIMS_SEGMENT =
    "eyJzdWIiOiIxMjM0NTY3ODkwIiwibmFtZSI6IkpvaG4gRG9lIiwiaWF0IjoxNTE2MjM5MDIyfQ";
inline constexpr const char* RS256_SIGNATURE =
    "Rx9EFQ0QIdrb3YtcXQMFnJoFHpQKzGFMO9OJGOf8Xuc-rQEKuiRgPsy6UJ4iJbMQMGDUTGR_iIOZ6BhnD-UWxtBTU4MRbUADnXLO"
    "STrM2G9Qe8ZqLU5otbqOQr6CBbolIj5Ah3bBGvR22Gev8N8CS4qvizcllzOTZ8VOL9ZZPvXtxzDj5pZUhnMNjAQUO58hCDJhfj9t"
    "-n5EN5-oUOnU0gozPdkhJSir50o5Z7sI3V2XyJVAOaVPmXyIPnjTwdMHJhqOO865OF2Rf_EVipB28Uc5HZOmtSsOFyQ4Ir6hksaw"
    "CYVTHhIoUfIEIOfAbOCUaa1XqsCsxHOKvR2A98TcLA";

// {"alg":"RS256","typ":"JWT"} . same claims, signed with the key above
inline constexpr const char* RS256_TOKEN =
    "eyJhbGciOiJSUzI1NiIsInR5cCI6IkpXVCJ9"
    ".eyJzdWIiOiIxMjM0NTY3ODkwIiwibmFtZSI6IkpvaG4gRG9lIiwiaWF0IjoxNTE2MjM5MDIyfQ"
    ".fL2H3_Uv_slbg7IYotZJWvz87uAEZzI0dvJH6Fhyrg37l34InmC-KduOsKAU5DbDjNb8CpZvxRP7KixcLeUt6bJ1bd1h-3-oBgx9"
    "p8EVg7OtD8A4VJDhdetWXhgwY8eX1-wZQpmdLIbWpNy-7I1suuQ2HlbJyp_mV-Nluo0esbgUseoESLo3zYThSra7BP0e_kzp8ssa"
    "E7Qt3VFOEiPwmZyXozEB_lgUuKUch_yzoesqVbNp3SPmP9hffjCXddu0Z0GtNzwieqTrnTzjrl4g8vYyNOT_sRgWgvjrzd6dMrhCq"
    "T1QmAzmJpNZf8zgQoR77DrDMUeBdTvuLPEmiSmh4A";

// Same header and claims signed with raw PKCS#1 v1.5 (no SHA-256 DigestInfo)
inline constexpr const char* RAW_PKCS1_TOKEN =
    "eyJhbGciOiJSUzI1NiIsInR5cCI6IkpXVCJ9"
    ".eyJzdWIiOiIxMjM0NTY3ODkwIiwibmFtZSI6IkpvaG4gRG9lIiwiaWF0IjoxNTE2MjM5MDIyfQ"
    ".YCSbIl71ucUlggqB4_6dErtfMq3n80LLKCbguSKp3iN8TZ_iRBW3Dw-75MlC8ooCFw7ketVxbPhkfvbGsyZkIfM1LIg4iY7mlxtF"
    "kxZUrY5mT7ymJRNJDLXAOvHpYnOckjgmjOQcGbin_LECxkqywi7BrOemEYZl5hPEJ3Wsgk-Ca4LNqk2XXaHpT-Tiz4Qqc6UDagn8"
    "3bZDQrHSedq-67HoWiOQNLipaG_7si4yRNOZKry3YFkulrE7K64sT92z_uEg4WOcZXtXtwhnrNdcnlw0eWle97N_L7pxYF1DUraZv"
    "nxuiiYcqNfbub29op0-ZskCNhwM_1OLbC8axTdpTQ";

// RS256 signature of "1234567890" with the key above
inline constexpr const char* MESSAGE_SIGNATURE =
    "fFCTUZ6-y7iW7IdGPWD_9bTujZJ_Y1SXB6l4q_8Sb8RRaRzGbDwA-lpRobsp7kxdiHQHLeDRB66Q9PmGativ3yRNP86abkpLML7R"
    "dA7ch2uBuMahgsAJgpJMxhoWD9F8a7-G9K-NsPAyI3WUWsgqqyawm6F74T52OwPlIbeBKrp-EKYRBRfLI4XQqsdqv0t26OlG3l_2U"
    "dbYFN_w44LbdxCxWZGo7plUNQJR7PXgRX9yoUhjEwLIU8foAVdtYXKeN5JalWuwhmXF9wKKDySbg3uAOSZfkZMfTuU2Cjbi55ibUn"
    "okI-NFqZ4o08ZZiUan8tXBw8yKUCxkYFB1aQuWsA";

/// Claim shape used across the tests
struct Claims {
    std::string sub;
    std::string name;
    std::int64_t iat = 0;

    friend bool operator==(const Claims&, const Claims&) = default;
};

inline void to_json(jwtkit::json& j, const Claims& claims) {
    j = jwtkit::json{{"sub", claims.sub}, {"name", claims.name}, {"iat", claims.iat}};
}

inline void from_json(const jwtkit::json& j, Claims& claims) {
    j.at("sub").get_to(claims.sub);
    j.at("name").get_to(claims.name);
    j.at("iat").get_to(claims.iat);
}

inline Claims johnDoe() {
    return Claims{"1234567890", "John Doe", 1516239022};
}

} // namespace fixtures
