#include <catch2/catch_all.hpp>

#include "httpauth/errors.hpp"
#include "httpauth/oidc-token.hpp"
#include "httpauth/secret-store.hpp"

using namespace httpauth;
using namespace std::chrono;

TEST_CASE("InMemorySecretStore", "[secret-store]") {
    InMemorySecretStore store;

    REQUIRE(!store.get("key"));
    REQUIRE(!store.remove("key"));

    store.set("key", "one");
    store.set("key", "two");
    REQUIRE(store.get("key") == "two");

    REQUIRE(store.remove("key"));
    REQUIRE(!store.get("key"));
}

TEST_CASE("Secret store key", "[secret-store][oidc]") {
    REQUIRE(secretStoreKey("https://idp.example.com/", "api-client") == "https://idp.example.com#api-client");
    REQUIRE(secretStoreKey("https://idp.example.com", "api-client") == "https://idp.example.com#api-client");
}

TEST_CASE("Stored OIDC token", "[secret-store][oidc]") {
    OidcToken token;
    token.accessToken = "access-1";
    token.refreshToken = "refresh-1";
    token.expiresAt = OidcToken::Clock::time_point(seconds(1700000000));

    SECTION("JSON form") {
        auto json = token.toJson();
        REQUIRE(json.find(R"("access_token")") != std::string::npos);
        REQUIRE(json.find("1700000000") != std::string::npos);
        REQUIRE(OidcToken::fromJson(json) == token);
    }

    SECTION("Not a stored token") {
        REQUIRE_THROWS_AS(OidcToken::fromJson("[1, 2]"), Error);
        REQUIRE_THROWS_AS(OidcToken::fromJson(R"({"refresh_token": "x"})"), Error);
        REQUIRE_THROWS_AS(OidcToken::fromJson("{{{"), Error);
    }
}

TEST_CASE("Token endpoint response", "[oidc]") {
    auto issuedAt = OidcToken::Clock::time_point(seconds(1000));

    SECTION("Complete response") {
        auto token = OidcToken::fromTokenResponse(
            R"({"access_token": "a", "refresh_token": "r", "expires_in": 60, "token_type": "Bearer"})", issuedAt);
        REQUIRE(token.accessToken == "a");
        REQUIRE(token.refreshToken == "r");
        REQUIRE(token.expiresAt == issuedAt + seconds(60));
    }

    SECTION("Defaults") {
        auto token = OidcToken::fromTokenResponse(R"({"access_token": "a"})", issuedAt, "previous");
        REQUIRE(token.refreshToken == "previous");
        REQUIRE(token.expiresAt == issuedAt + OidcToken::DEFAULT_EXPIRES_IN);
    }

    SECTION("No access token") {
        REQUIRE_THROWS_AS(OidcToken::fromTokenResponse(R"({"error": "invalid_grant"})", issuedAt), ConnectionError);
    }

    SECTION("Refresh skew") {
        auto token = OidcToken::fromTokenResponse(R"({"access_token": "a", "expires_in": 10})", issuedAt);
        REQUIRE(token.needsRefresh(issuedAt, seconds(30)));
        REQUIRE(!token.needsRefresh(issuedAt, seconds(5)));
    }
}
