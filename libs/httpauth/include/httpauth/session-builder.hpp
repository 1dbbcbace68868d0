#pragma once

#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "authorization-code-receiver.hpp"
#include "credentials.hpp"
#include "http-client.hpp"
#include "mutual-auth.hpp"
#include "secret-store.hpp"
#include "session.hpp"
#include "settings.hpp"

namespace httpauth
{

/**
 * Negotiates the authentication scheme of an API server:
 *
 *   SessionBuilder builder("https://api.example.com/v1/");
 *   auto session = builder.withBasic("joe", "secret").connect();
 *
 * Exactly one with<Scheme>() call is allowed. connect() probes the
 * server once, matches its WWW-Authenticate challenges against the
 * credentials and caches the resulting session.
 */
class SessionBuilder
{
public:
    enum class State
    {
        Empty,
        CredentialSet,
        Finalized,
        Failed  // after an AuthenticationMismatchError
    };

    /**
     * Without an httpClient, an HttpLibHttpClient is used.
     */
    explicit SessionBuilder(std::string baseUrl,
                            SessionConfiguration config = {},
                            std::shared_ptr<IHttpClient> httpClient = {});

    /*
     * Credential selection. A second call throws ConfigurationError.
     */
    SessionBuilder& withAnonymous();
    SessionBuilder& withBasic(std::string username,
                              std::string password,
                              std::optional<std::string> domain = {});
    SessionBuilder& withWindowsIntegrated();
    SessionBuilder& withOidc(OidcCredentials credentials = {});
    SessionBuilder& withCredentials(CredentialConfig credentials);

    /**
     * Merge the settings for the base URL beneath the explicit
     * configuration, and take its credentials if it has any and
     * none were configured before.
     */
    SessionBuilder& withSettings(Settings const& settings);

    /*
     * Capabilities. Optional; defaults are used where needed.
     */
    SessionBuilder& withMutualAuthProvider(std::shared_ptr<IMutualAuthProvider> provider);
    SessionBuilder& withSecretStore(std::shared_ptr<ISecretStore> secretStore);
    SessionBuilder& withAuthorizationCodeReceiver(std::shared_ptr<IAuthorizationCodeReceiver> receiver);
    SessionBuilder& withIdentityProviderConfiguration(SessionConfiguration idpConfig);

    /**
     * Probe the server and build the session. Later calls return the
     * same session. Concurrent calls wait for the first one.
     *
     * Throws ConfigurationError, ConnectionError, TimeoutError,
     * AuthenticationMismatchError, HandshakeFailedError, and for OIDC
     * AuthorizationError or ReauthenticationRequiredError.
     */
    std::shared_ptr<Session> connect();

    State state() const;

private:
    void setCredentials(CredentialConfig credentials);
    void validate();
    std::shared_ptr<Session> finalize();
    AuthStrategy createStrategy(SchemeSelection const& selection);
    AuthStrategy createOidcStrategy(OidcCredentials const& credentials, Challenge const& challenge);

    std::string baseUrl_;
    SessionConfiguration config_;
    std::shared_ptr<IHttpClient> httpClient_;

    std::optional<CredentialConfig> credentials_;
    std::shared_ptr<IMutualAuthProvider> mutualAuthProvider_;
    std::shared_ptr<ISecretStore> secretStore_;
    std::shared_ptr<IAuthorizationCodeReceiver> receiver_;
    SessionConfiguration idpConfig_;

    mutable std::mutex mutex_;
    State state_ = State::Empty;
    std::shared_ptr<Session> session_;
    std::exception_ptr failure_;
};

std::string stateName(SessionBuilder::State state);

}
