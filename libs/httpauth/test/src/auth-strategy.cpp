#include <catch2/catch_all.hpp>

#include "httpauth/auth-strategy.hpp"
#include "httpauth/errors.hpp"
#include "httpauth/session.hpp"

#include "mock-servers.hpp"

using namespace httpauth;

namespace
{

const char* API_URL = "https://api.example.com/v1/";

std::string authorizationOf(Request const& request)
{
    auto it = request.headers.find("Authorization");
    return it == request.headers.end() ? std::string() : it->second;
}

Response challenge(std::string const& url, std::string const& header)
{
    return {401, {{"WWW-Authenticate", header}}, "", url};
}

std::string headerOf(Request const& request, std::string const& name)
{
    auto it = request.headers.find(name);
    return it == request.headers.end() ? std::string() : it->second;
}

}

TEST_CASE("Anonymous strategy", "[auth-strategy]") {
    auto client = std::make_shared<MockHttpClient>();
    client->sendFun = [](Request const& request, SessionConfiguration const&) -> Response {
        REQUIRE(request.headers.count("Authorization") == 0);
        return {200, {}, "ok", request.url};
    };

    Session session(API_URL, AnonymousStrategy{}, client, {});
    REQUIRE(session.get("items").content == "ok");
    REQUIRE(session.scheme() == AuthScheme::Anonymous);
}

TEST_CASE("Basic strategy", "[auth-strategy][basic]") {
    std::vector<std::string> seen;
    auto client = std::make_shared<MockHttpClient>();
    client->sendFun = [&](Request const& request, SessionConfiguration const&) -> Response {
        seen.push_back(authorizationOf(request));
        return {200, {}, "", request.url};
    };

    SECTION("Plain user") {
        Session session(API_URL, BasicStrategy(BasicCredentials{"joe", "secret", {}, {}}), client, {});
        session.get("items");
        REQUIRE(seen == std::vector<std::string>{"Basic am9lOnNlY3JldA=="});
    }

    SECTION("Domain user") {
        BasicStrategy strategy(BasicCredentials{"joe", "secret", "CORP", {}});
        REQUIRE(strategy.username() == "CORP\\joe");

        Session session(API_URL, std::move(strategy), client, {});
        session.get("items");
        session.get("items");
        REQUIRE(seen == std::vector<std::string>{"Basic Q09SUFxqb2U6c2VjcmV0", "Basic Q09SUFxqb2U6c2VjcmV0"});
    }

    SECTION("Rejected credentials are returned, not retried") {
        client->sendFun = [&](Request const& request, SessionConfiguration const&) -> Response {
            seen.push_back(authorizationOf(request));
            return challenge(request.url, R"(Basic realm="api")");
        };
        Session session(API_URL, BasicStrategy(BasicCredentials{"joe", "wrong", {}, {}}), client, {});
        REQUIRE(session.get("items").status == 401);
        REQUIRE(seen.size() == 1);
    }
}

TEST_CASE("Negotiate handshake", "[auth-strategy][negotiate]") {
    auto provider = std::make_shared<ScriptedMutualAuthProvider>();
    auto client = std::make_shared<MockHttpClient>();
    std::vector<std::string> seen;

    SECTION("One round with mutual authentication") {
        client->sendFun = [&](Request const& request, SessionConfiguration const&) -> Response {
            seen.push_back(authorizationOf(request));
            if (seen.size() == 1)
                return challenge(request.url, "Negotiate server-1");
            return {200, {{"WWW-Authenticate", "Negotiate server-final"}}, "ok", request.url};
        };

        Session session(API_URL, NegotiateStrategy(provider), client, {});
        auto response = session.get("items");

        REQUIRE(response.status == 200);
        REQUIRE(seen == std::vector<std::string>{"Negotiate client-token-0", "Negotiate client-token-1"});
        REQUIRE(provider->receivedServerTokens == std::vector<std::string>{"server-1"});
        REQUIRE(provider->lastTargetHost == "api.example.com");
    }

    SECTION("Server proves its identity on the final response") {
        provider->roundsUntilComplete = 2;
        client->sendFun = [&](Request const& request, SessionConfiguration const&) -> Response {
            seen.push_back(authorizationOf(request));
            if (seen.size() == 1)
                return challenge(request.url, "Negotiate server-1");
            return {200, {{"WWW-Authenticate", "Negotiate server-final"}}, "ok", request.url};
        };

        Session session(API_URL, NegotiateStrategy(provider), client, {});
        REQUIRE(session.get("items").status == 200);
        REQUIRE(provider->receivedServerTokens == std::vector<std::string>{"server-1", "server-final"});
    }

    SECTION("Each request runs its own handshake") {
        client->sendFun = [&](Request const& request, SessionConfiguration const&) -> Response {
            seen.push_back(authorizationOf(request));
            if (authorizationOf(request) == "Negotiate client-token-0")
                return challenge(request.url, "Negotiate server-1");
            return {200, {}, "ok", request.url};
        };

        Session session(API_URL, NegotiateStrategy(provider), client, {});
        session.get("a");
        session.get("b");
        REQUIRE(provider->contextCount == 2);
        REQUIRE(seen.size() == 4);
    }

    SECTION("Kerberos spelling is echoed") {
        client->sendFun = [&](Request const& request, SessionConfiguration const&) -> Response {
            seen.push_back(authorizationOf(request));
            return {200, {}, "ok", request.url};
        };

        Session session(API_URL, NegotiateStrategy(provider, "Kerberos"), client, {});
        session.get("items");
        REQUIRE(seen == std::vector<std::string>{"Kerberos client-token-0"});
    }

    SECTION("Handshake is bounded") {
        provider->roundsUntilComplete = 100;
        client->sendFun = [&](Request const& request, SessionConfiguration const&) -> Response {
            seen.push_back(authorizationOf(request));
            return challenge(request.url, "Negotiate server-" + std::to_string(seen.size()));
        };

        Session session(API_URL, NegotiateStrategy(provider), client, {});
        REQUIRE_THROWS_AS(session.get("items"), HandshakeFailedError);
        REQUIRE(seen.size() == 1 + MutualAuthStrategy::MAX_HANDSHAKE_ROUNDS);
    }

    SECTION("Provider failure") {
        provider->failOnServerToken = true;
        client->sendFun = [&](Request const& request, SessionConfiguration const&) -> Response {
            return challenge(request.url, "Negotiate garbage");
        };

        Session session(API_URL, NegotiateStrategy(provider), client, {});
        REQUIRE_THROWS_AS(session.get("items"), HandshakeFailedError);
    }

    SECTION("Rejection without server token") {
        client->sendFun = [&](Request const& request, SessionConfiguration const&) -> Response {
            seen.push_back(authorizationOf(request));
            return challenge(request.url, "Negotiate");
        };

        Session session(API_URL, NegotiateStrategy(provider), client, {});
        REQUIRE(session.get("items").status == 401);
        REQUIRE(seen.size() == 1);
    }
}

TEST_CASE("NTLM handshake", "[auth-strategy][ntlm]") {
    auto provider = std::make_shared<ScriptedMutualAuthProvider>();
    provider->roundsUntilComplete = 2;
    auto client = std::make_shared<MockHttpClient>();
    std::vector<std::string> seen;

    // Negotiate -> Challenge -> Authenticate
    client->sendFun = [&](Request const& request, SessionConfiguration const&) -> Response {
        seen.push_back(authorizationOf(request));
        switch (seen.size()) {
        case 1: return challenge(request.url, "NTLM type2-challenge");
        default: return {200, {}, "ok", request.url};
        }
    };

    Session session(API_URL, NtlmStrategy(provider), client, {});
    REQUIRE(session.get("items").status == 200);
    REQUIRE(seen == std::vector<std::string>{"NTLM client-token-0", "NTLM client-token-1"});
    REQUIRE(session.scheme() == AuthScheme::Ntlm);
}

TEST_CASE("Proxy handshake", "[auth-strategy][ntlm][proxy]") {
    auto provider = std::make_shared<ScriptedMutualAuthProvider>();
    provider->roundsUntilComplete = 2;
    auto client = std::make_shared<MockHttpClient>();
    std::vector<std::string> authorization;
    std::vector<std::string> proxyAuthorization;

    SessionConfiguration config;
    config.proxy = SessionConfiguration::Proxy();
    config.proxy->host = "proxy.example.com";
    config.proxy->port = 3128;

    SECTION("Continuation goes to the proxy") {
        client->sendFun = [&](Request const& request, SessionConfiguration const&) -> Response {
            authorization.push_back(headerOf(request, "Authorization"));
            proxyAuthorization.push_back(headerOf(request, "Proxy-Authorization"));
            switch (authorization.size()) {
            case 1: return {407, {{"Proxy-Authenticate", "NTLM"}}, "", request.url};
            case 2: return {407, {{"Proxy-Authenticate", "NTLM type2-challenge"}}, "", request.url};
            default: return {200, {}, "ok", request.url};
            }
        };

        Session session(API_URL, NtlmStrategy(provider), client, config);
        REQUIRE(session.get("items").status == 200);
        REQUIRE(authorization == std::vector<std::string>{"NTLM client-token-0", "", ""});
        REQUIRE(proxyAuthorization == std::vector<std::string>{"", "NTLM client-token-0", "NTLM client-token-1"});
        REQUIRE(provider->receivedServerTokens == std::vector<std::string>{"type2-challenge"});
        REQUIRE(provider->contextCount == 2);
        REQUIRE(provider->lastTargetHost == "proxy.example.com");
    }

    SECTION("Proxy asking for another scheme") {
        client->sendFun = [&](Request const& request, SessionConfiguration const&) -> Response {
            authorization.push_back(headerOf(request, "Authorization"));
            return {407, {{"Proxy-Authenticate", "Basic realm=\"proxy\""}}, "", request.url};
        };

        Session session(API_URL, NtlmStrategy(provider), client, config);
        REQUIRE(session.get("items").status == 407);
        REQUIRE(authorization.size() == 1);
    }
}

TEST_CASE("Mutual auth strategies need a provider", "[auth-strategy]") {
    REQUIRE_THROWS_AS(NtlmStrategy(nullptr), ConfigurationError);
    REQUIRE_THROWS_AS(NegotiateStrategy(nullptr), ConfigurationError);
}

TEST_CASE("OIDC strategy", "[auth-strategy][oidc]") {
    auto idp = std::make_shared<MockIdentityProvider>();
    auto client = std::make_shared<MockHttpClient>();
    std::vector<std::string> seen;
    std::function<Response(Request const&)> api;

    client->sendFun = [&](Request const& request, SessionConfiguration const& config) -> Response {
        if (idp->handles(request.url))
            return idp->handle(request, config);
        seen.push_back(authorizationOf(request));
        return api(request);
    };

    OidcClientConfig oidcClient;
    oidcClient.authority = MockIdentityProvider::AUTHORITY;
    oidcClient.clientId = "api-client";
    oidcClient.redirectUri = "http://localhost:32284/";
    oidcClient.audience = "https://api.example.com";

    auto metadata = IdentityProviderMetadata::discover(*client, MockIdentityProvider::AUTHORITY, {});
    auto manager = std::make_shared<OidcTokenManager>(oidcClient, metadata, client, SessionConfiguration{});
    manager->authorizeWithRefreshToken("seed");
    REQUIRE(idp->refreshRequestCount == 1);

    Session session(API_URL, OidcStrategy(manager), client, {});

    SECTION("Bearer token and audience header") {
        std::string audience;
        api = [&](Request const& request) -> Response {
            audience = request.headers.find("audience")->second;
            return {200, {}, "ok", request.url};
        };
        session.get("items");
        REQUIRE(seen == std::vector<std::string>{"Bearer access-1"});
        REQUIRE(audience == "https://api.example.com");
    }

    SECTION("Rejected token is refreshed once") {
        api = [&](Request const& request) -> Response {
            if (authorizationOf(request) == "Bearer access-1")
                return {401, {}, "", request.url};
            return {200, {}, "ok", request.url};
        };
        REQUIRE(session.get("items").status == 200);
        REQUIRE(seen == std::vector<std::string>{"Bearer access-1", "Bearer access-2"});
        REQUIRE(idp->refreshRequestCount == 2);
    }

    SECTION("Second rejection is returned to the caller") {
        api = [&](Request const& request) -> Response {
            return {401, {}, "", request.url};
        };
        REQUIRE(session.get("items").status == 401);
        REQUIRE(seen.size() == 2);
        REQUIRE(idp->refreshRequestCount == 2);
        REQUIRE(manager->state() == OidcTokenManager::State::Authorized);
    }

    SECTION("Forbidden is not a token problem") {
        api = [&](Request const& request) -> Response {
            return {403, {}, "", request.url};
        };
        REQUIRE(session.get("items").status == 403);
        REQUIRE(idp->refreshRequestCount == 1);
    }
}
