#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "challenge.hpp"
#include "credentials.hpp"
#include "http-client.hpp"
#include "oidc-token.hpp"
#include "secret-store.hpp"
#include "authorization-code-receiver.hpp"

namespace httpauth
{

/**
 * Endpoints from <authority>/.well-known/openid-configuration.
 */
struct IdentityProviderMetadata
{
    std::string issuer;
    std::string authorizationEndpoint;
    std::string tokenEndpoint;

    /**
     * Fetch and validate the discovery document.
     * Throws ConnectionError if it cannot be fetched, is not JSON,
     * or lacks authorization_endpoint/token_endpoint.
     */
    static IdentityProviderMetadata discover(
        IHttpClient& client,
        std::string const& authority,
        SessionConfiguration const& idpConfig);
};

/**
 * OIDC client parameters after merging the configured credentials
 * with the parameters of the server's Bearer challenge.
 */
struct OidcClientConfig
{
    std::string authority;
    std::string clientId;
    std::string clientSecret;  // empty for public clients
    std::string redirectUri;
    std::vector<std::string> scopes;
    std::string audience;
    std::chrono::seconds loginTimeout = OidcCredentials::DEFAULT_LOGIN_TIMEOUT;

    /**
     * Explicit credential fields win over challenge parameters
     * (authority, clientid, redirecturi, scope, apiAudience).
     * A keychain client secret is loaded here.
     *
     * Throws ConfigurationError naming every missing mandatory field.
     */
    static OidcClientConfig resolve(
        OidcCredentials const& credentials,
        Challenge const* bearerChallenge);
};

/**
 * Owns the OIDC token of one session.
 *
 *   NoToken -> Authorizing -> Authorized -> Refreshing -> Authorized
 *                                                      -> Expired
 *
 * validAccessToken() is safe to call from many threads. At most one
 * refresh request is in flight; concurrent callers wait for it and
 * share its result (or its error).
 *
 * If a secret store is given, it holds the canonical copy of the token.
 */
class OidcTokenManager
{
public:
    enum class State
    {
        NoToken,
        Authorizing,
        Authorized,
        Refreshing,
        Expired
    };

    using Clock = std::function<OidcToken::Clock::time_point()>;

    static constexpr std::chrono::seconds DEFAULT_SKEW{30};

    OidcTokenManager(
        OidcClientConfig client,
        IdentityProviderMetadata metadata,
        std::shared_ptr<IHttpClient> httpClient,
        SessionConfiguration const& idpConfig,
        std::shared_ptr<ISecretStore> secretStore = {},
        Clock clock = {});

    /**
     * Authorization code flow with PKCE.
     * Throws TimeoutError if the login does not complete within
     * loginTimeout, AuthorizationError if the provider refuses it.
     */
    void authorizeInteractively(IAuthorizationCodeReceiver& receiver);

    /**
     * Redeem a refresh token obtained elsewhere.
     * Throws ReauthenticationRequiredError if it is rejected.
     */
    void authorizeWithRefreshToken(std::string const& refreshToken);

    /**
     * Adopt the token held by the secret store, refreshing it if needed.
     * Throws ReauthenticationRequiredError if nothing usable is stored.
     */
    void authorizeFromSecretStore();

    /**
     * Current access token, refreshed first if it expires within the skew.
     * Throws ReauthenticationRequiredError in state Expired/NoToken.
     */
    std::string validAccessToken();

    /**
     * The server rejected `rejectedAccessToken`. Refresh unless another
     * caller already replaced it, and return the new access token.
     */
    std::string forceRefresh(std::string const& rejectedAccessToken);

    State state() const;
    std::optional<OidcToken> token() const;
    OidcClientConfig const& client() const { return client_; }
    IdentityProviderMetadata const& metadata() const { return metadata_; }

    /**
     * Tokens expiring within `skew` are refreshed before use.
     */
    void setSkew(std::chrono::seconds skew);
    std::chrono::seconds skew() const;

private:
    std::string awaitRefresh(std::unique_lock<std::mutex>& lock);
    OidcToken refreshOrAdopt(OidcToken const& current);
    OidcToken requestRefresh(std::string const& refreshToken);
    OidcToken exchangeCode(std::string const& code, std::string const& codeVerifier);
    Response postToTokenEndpoint(std::multimap<std::string, std::string> fields);
    void adopt(OidcToken token);
    std::optional<OidcToken> loadStored() const;
    void persist(OidcToken const& token) const;
    void forgetStored() const;
    OidcToken::Clock::time_point now() const;

    OidcClientConfig client_;
    IdentityProviderMetadata metadata_;
    std::shared_ptr<IHttpClient> httpClient_;
    SessionConfiguration idpConfig_;
    std::shared_ptr<ISecretStore> secretStore_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::chrono::seconds skew_ = DEFAULT_SKEW;
    State state_ = State::NoToken;
    std::optional<OidcToken> token_;
    std::shared_future<OidcToken> inFlight_;
};

std::string stateName(OidcTokenManager::State state);

}
