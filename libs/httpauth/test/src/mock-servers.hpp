#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "httpauth/authorization-code-receiver.hpp"
#include "httpauth/http-client.hpp"
#include "httpauth/mutual-auth.hpp"
#include "httpauth/url.hpp"

/**
 * Mock OpenID Connect identity provider.
 *
 * Serves the discovery document and the token endpoint for the
 * authorization_code and refresh_token grants.
 */
class MockIdentityProvider {
public:
    static constexpr char const* AUTHORITY = "https://idp.example.com/";
    static constexpr char const* TOKEN_ENDPOINT = "https://idp.example.com/oauth/token";
    static constexpr char const* AUTHORIZATION_ENDPOINT = "https://idp.example.com/oauth/authorize";

    // Configuration
    int tokenExpirySeconds = 3600;
    bool issueRefreshToken = true;
    bool rotateRefreshToken = true;
    int refreshFailureStatus = 0;  // e.g. 400, 401, 503
    bool discoveryLacksTokenEndpoint = false;
    std::string advertisedAuthorizationEndpoint = AUTHORIZATION_ENDPOINT;
    std::chrono::milliseconds refreshDelay{0};
    std::string expectedClientId = "api-client";
    std::string expectedCode = "auth-code-1";

    // Tracking for assertions
    std::atomic<int> discoveryRequestCount{0};
    std::atomic<int> codeExchangeCount{0};
    std::atomic<int> refreshRequestCount{0};
    std::multimap<std::string, std::string> lastTokenRequestFields;
    httpauth::Headers lastTokenRequestHeaders;
    httpauth::Headers lastTokenRequestConfigHeaders;
    std::string lastCodeVerifier;
    std::string lastIssuedAccessToken;
    std::string lastIssuedRefreshToken;

    bool handles(std::string const& url) const
    {
        return url.rfind(AUTHORITY, 0) == 0;
    }

    httpauth::Response handle(httpauth::Request const& request, httpauth::SessionConfiguration const& config)
    {
        if (request.url == std::string(AUTHORITY) + ".well-known/openid-configuration") {
            ++discoveryRequestCount;
            std::string document = std::string(R"({"issuer": ")") + AUTHORITY + R"(", )" +
                R"("authorization_endpoint": ")" + advertisedAuthorizationEndpoint + R"(")";
            if (!discoveryLacksTokenEndpoint)
                document += std::string(R"(, "token_endpoint": ")") + TOKEN_ENDPOINT + R"(")";
            document += "}";
            return {200, {}, document, request.url};
        }

        if (request.url == TOKEN_ENDPOINT && request.method == "POST")
            return handleTokenRequest(request, config);

        return {404, {}, "", request.url};
    }

    httpauth::Response handleTokenRequest(httpauth::Request const& request, httpauth::SessionConfiguration const& config)
    {
        auto fields = httpauth::Url::formDecode(request.body ? request.body->body : "");
        std::string grantType;
        std::string refreshToken;
        {
            std::lock_guard lock(mutex_);
            lastTokenRequestFields = fields;
            lastTokenRequestHeaders = request.headers;
            lastTokenRequestConfigHeaders = config.headers;
        }
        if (auto it = fields.find("grant_type"); it != fields.end())
            grantType = it->second;

        if (grantType == "authorization_code") {
            ++codeExchangeCount;
            auto code = fields.find("code");
            if (code == fields.end() || code->second != expectedCode)
                return {400, {}, R"({"error": "invalid_grant"})", request.url};
            lastCodeVerifier = fields.find("code_verifier")->second;
            return issue(request.url);
        }

        if (grantType == "refresh_token") {
            ++refreshRequestCount;
            if (refreshDelay.count() > 0)
                std::this_thread::sleep_for(refreshDelay);
            if (refreshFailureStatus == 400 || refreshFailureStatus == 401)
                return {refreshFailureStatus, {}, R"({"error": "invalid_grant"})", request.url};
            if (refreshFailureStatus)
                return {refreshFailureStatus, {}, "upstream unavailable", request.url};

            auto presented = fields.find("refresh_token");
            if (presented == fields.end() || presented->second.empty())
                return {400, {}, R"({"error": "invalid_request"})", request.url};
            return issue(request.url, rotateRefreshToken);
        }

        return {400, {}, R"({"error": "unsupported_grant_type"})", request.url};
    }

    std::string lastField(std::string const& name) const
    {
        std::lock_guard lock(mutex_);
        auto it = lastTokenRequestFields.find(name);
        return it == lastTokenRequestFields.end() ? std::string() : it->second;
    }

private:
    httpauth::Response issue(std::string const& url, bool withRefreshToken = true)
    {
        std::lock_guard lock(mutex_);
        ++issued_;
        lastIssuedAccessToken = "access-" + std::to_string(issued_);
        std::string body = R"({"token_type": "Bearer", "access_token": ")" + lastIssuedAccessToken + R"(")";
        if (tokenExpirySeconds >= 0)
            body += R"(, "expires_in": )" + std::to_string(tokenExpirySeconds);
        if (issueRefreshToken && withRefreshToken) {
            lastIssuedRefreshToken = "refresh-" + std::to_string(issued_);
            body += R"(, "refresh_token": ")" + lastIssuedRefreshToken + R"(")";
        }
        body += "}";
        return {200, {}, body, url};
    }

    mutable std::mutex mutex_;
    int issued_ = 0;
};

/**
 * Answers the login instead of a user in a browser.
 */
class ScriptedCodeReceiver : public httpauth::IAuthorizationCodeReceiver {
public:
    std::string code = "auth-code-1";
    std::string error;
    bool echoState = true;

    int callCount = 0;
    httpauth::AuthorizationRequest lastRequest;

    httpauth::AuthorizationResponse receive(httpauth::AuthorizationRequest const& request) override
    {
        ++callCount;
        lastRequest = request;

        httpauth::AuthorizationResponse response;
        response.code = error.empty() ? code : "";
        response.error = error;
        response.state = echoState ? request.state : "forged-state";
        return response;
    }

    std::string authorizationParam(std::string const& name) const
    {
        auto params = httpauth::Url::parse(lastRequest.authorizationUrl).queryParams();
        auto it = params.find(name);
        return it == params.end() ? std::string() : it->second;
    }
};

/**
 * Mutual authentication provider which emits "client-token-<n>"
 * and completes after `roundsUntilComplete` server tokens.
 */
class ScriptedMutualAuthProvider : public httpauth::IMutualAuthProvider {
public:
    bool supportsNtlm = true;
    bool supportsNegotiate = true;
    int roundsUntilComplete = 1;
    bool failOnServerToken = false;

    std::atomic<int> contextCount{0};
    std::vector<std::string> receivedServerTokens;
    std::string lastTargetHost;

    bool supports(httpauth::AuthScheme scheme) const override
    {
        if (scheme == httpauth::AuthScheme::Ntlm)
            return supportsNtlm;
        if (scheme == httpauth::AuthScheme::Negotiate)
            return supportsNegotiate;
        return false;
    }

    std::unique_ptr<httpauth::IMutualAuthContext> createContext(
        httpauth::AuthScheme, std::string const& targetHost) override
    {
        ++contextCount;
        lastTargetHost = targetHost;
        return std::make_unique<Context>(*this);
    }

private:
    class Context : public httpauth::IMutualAuthContext {
    public:
        explicit Context(ScriptedMutualAuthProvider& provider) : provider_(provider) {}

        httpauth::MutualAuthStep produceToken(std::optional<std::string> const& serverToken) override
        {
            using Status = httpauth::MutualAuthStep::Status;
            if (serverToken) {
                provider_.receivedServerTokens.push_back(*serverToken);
                if (provider_.failOnServerToken)
                    return {Status::Failed, {}, "bad server token"};
                ++rounds_;
            }
            auto status = rounds_ >= provider_.roundsUntilComplete ? Status::Complete : Status::ContinueNeeded;
            return {status, "client-token-" + std::to_string(rounds_), {}};
        }

    private:
        ScriptedMutualAuthProvider& provider_;
        int rounds_ = 0;
    };
};
