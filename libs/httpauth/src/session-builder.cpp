#include "session-builder.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "oidc-token-manager.hpp"
#include "url.hpp"

#include "stx/format.h"
#include "stx/string.h"

namespace httpauth
{

namespace
{

std::string joinSchemes(std::vector<AuthScheme> const& schemes)
{
    std::vector<std::string> names;
    for (auto scheme : schemes)
        names.push_back(schemeName(scheme));
    return stx::join(names.begin(), names.end(), ", ");
}

}

std::string stateName(SessionBuilder::State state)
{
    switch (state) {
    case SessionBuilder::State::Empty: return "Empty";
    case SessionBuilder::State::CredentialSet: return "CredentialSet";
    case SessionBuilder::State::Finalized: return "Finalized";
    case SessionBuilder::State::Failed: return "Failed";
    }
    return "Unknown";
}

SessionBuilder::SessionBuilder(std::string baseUrl,
                               SessionConfiguration config,
                               std::shared_ptr<IHttpClient> httpClient)
    : baseUrl_(std::move(baseUrl))
    , config_(std::move(config))
    , httpClient_(std::move(httpClient))
{
    if (!httpClient_)
        httpClient_ = std::make_shared<HttpLibHttpClient>();
}

SessionBuilder& SessionBuilder::withAnonymous()
{
    setCredentials(AnonymousCredentials{});
    return *this;
}

SessionBuilder& SessionBuilder::withBasic(std::string username,
                                          std::string password,
                                          std::optional<std::string> domain)
{
    setCredentials(BasicCredentials{std::move(username), std::move(password), std::move(domain), {}});
    return *this;
}

SessionBuilder& SessionBuilder::withWindowsIntegrated()
{
    setCredentials(WindowsIntegratedCredentials{});
    return *this;
}

SessionBuilder& SessionBuilder::withOidc(OidcCredentials credentials)
{
    setCredentials(std::move(credentials));
    return *this;
}

SessionBuilder& SessionBuilder::withCredentials(CredentialConfig credentials)
{
    setCredentials(std::move(credentials));
    return *this;
}

SessionBuilder& SessionBuilder::withSettings(Settings const& settings)
{
    // Explicitly configured credentials win over the settings file.
    auto credentials = settings.credentialsFor(baseUrl_);
    if (credentials && state() == State::Empty)
        setCredentials(std::move(*credentials));

    std::lock_guard lock(mutex_);
    auto merged = settings[baseUrl_];
    merged |= config_;
    config_ = std::move(merged);
    log().debug("Configuration for {}: {}", baseUrl_, config_.toSafeString());
    return *this;
}

SessionBuilder& SessionBuilder::withMutualAuthProvider(std::shared_ptr<IMutualAuthProvider> provider)
{
    std::lock_guard lock(mutex_);
    mutualAuthProvider_ = std::move(provider);
    return *this;
}

SessionBuilder& SessionBuilder::withSecretStore(std::shared_ptr<ISecretStore> secretStore)
{
    std::lock_guard lock(mutex_);
    secretStore_ = std::move(secretStore);
    return *this;
}

SessionBuilder& SessionBuilder::withAuthorizationCodeReceiver(std::shared_ptr<IAuthorizationCodeReceiver> receiver)
{
    std::lock_guard lock(mutex_);
    receiver_ = std::move(receiver);
    return *this;
}

SessionBuilder& SessionBuilder::withIdentityProviderConfiguration(SessionConfiguration idpConfig)
{
    std::lock_guard lock(mutex_);
    idpConfig_ = std::move(idpConfig);
    return *this;
}

void SessionBuilder::setCredentials(CredentialConfig credentials)
{
    std::lock_guard lock(mutex_);
    if (state_ != State::Empty)
        throw logRuntimeError<ConfigurationError>(stx::format(
            "Cannot configure {} credentials: builder for {} is in state {}{}.",
            credentialKind(credentials), baseUrl_, stateName(state_),
            credentials_ ? " with " + credentialKind(*credentials_) + " credentials" : std::string()));

    credentials_ = std::move(credentials);
    state_ = State::CredentialSet;
}

SessionBuilder::State SessionBuilder::state() const
{
    std::lock_guard lock(mutex_);
    return state_;
}

std::shared_ptr<Session> SessionBuilder::connect()
{
    std::lock_guard lock(mutex_);
    switch (state_) {
    case State::Finalized:
        return session_;
    case State::Failed:
        std::rethrow_exception(failure_);
    case State::Empty:
        throw logRuntimeError<ConfigurationError>(stx::format(
            "No credentials configured for {}.", baseUrl_));
    case State::CredentialSet:
        break;
    }

    validate();
    try {
        session_ = finalize();
        state_ = State::Finalized;
        return session_;
    }
    catch (AuthenticationMismatchError const&) {
        state_ = State::Failed;
        failure_ = std::current_exception();
        throw;
    }
}

void SessionBuilder::validate()
{
    Url::parse(baseUrl_);

    if (std::holds_alternative<WindowsIntegratedCredentials>(*credentials_)) {
        if (!mutualAuthProvider_)
            mutualAuthProvider_ = defaultMutualAuthProvider();
        if (!mutualAuthProvider_)
            throw logRuntimeError<ConfigurationError>(
                "Windows-integrated authentication is not available in this build: "
                "no mutual authentication provider.");
    }

    if (auto oidc = std::get_if<OidcCredentials>(&*credentials_)) {
        if (oidc->mode == OidcCredentials::Mode::RefreshToken && oidc->refreshToken.empty())
            throw logRuntimeError<ConfigurationError>("OIDC refresh token mode requires a refresh token.");
    }
}

std::shared_ptr<Session> SessionBuilder::finalize()
{
    auto kind = credentialKind(*credentials_);
    log().info("Probing {} for {} authentication ...", baseUrl_, kind);

    Request probe;
    probe.url = baseUrl_;
    auto response = httpClient_->send(probe, config_);
    log().debug("  ... status {}.", response.status);

    auto makeSession = [&](AuthStrategy strategy) {
        return std::make_shared<Session>(baseUrl_, std::move(strategy), httpClient_, config_);
    };

    if (!response.isAuthChallenge()) {
        if (std::holds_alternative<AnonymousCredentials>(*credentials_))
            return makeSession(AnonymousStrategy{});
        if (response.isSuccess() || response.isRedirect()) {
            log().warn("{} accepts anonymous requests, continuing without {} credentials.", baseUrl_, kind);
            return makeSession(AnonymousStrategy{});
        }
        throw logRuntimeError<ConnectionError>(stx::format(
            "Probing {} returned unexpected status {}.", baseUrl_, response.status), response.status);
    }

    auto challenges = parseChallenges(response.headerValues("WWW-Authenticate"));
    auto advertised = advertisedSchemes(challenges);
    log().debug("  ... server advertises [{}].", stx::join(advertised.begin(), advertised.end(), ", "));

    auto selection = selectScheme(*credentials_, challenges, mutualAuthProvider_.get());
    if (!selection)
        throw logRuntimeError<AuthenticationMismatchError>(stx::format(
            "{} advertises [{}], which the configured {} credentials cannot satisfy.",
            baseUrl_, stx::join(advertised.begin(), advertised.end(), ", "), kind),
            kind, advertised);

    if (selection->candidates.size() > 1)
        log().info("Several advertised schemes match ({}), choosing {} by precedence.",
                   joinSchemes(selection->candidates), schemeName(selection->scheme));
    else
        log().info("Using {} authentication.", schemeName(selection->scheme));

    return makeSession(createStrategy(*selection));
}

AuthStrategy SessionBuilder::createStrategy(SchemeSelection const& selection)
{
    switch (selection.scheme) {
    case AuthScheme::Anonymous:
        return AnonymousStrategy{};
    case AuthScheme::Basic:
        return BasicStrategy(std::get<BasicCredentials>(*credentials_));
    case AuthScheme::Ntlm:
        return NtlmStrategy(mutualAuthProvider_);
    case AuthScheme::Negotiate:
        return NegotiateStrategy(mutualAuthProvider_, selection.challenge.scheme);
    case AuthScheme::Oidc:
        return createOidcStrategy(std::get<OidcCredentials>(*credentials_), selection.challenge);
    }
    throw logRuntimeError<ConfigurationError>("Unknown authentication scheme.");
}

AuthStrategy SessionBuilder::createOidcStrategy(OidcCredentials const& credentials, Challenge const& challenge)
{
    auto client = OidcClientConfig::resolve(credentials, &challenge);
    auto metadata = IdentityProviderMetadata::discover(*httpClient_, client.authority, idpConfig_);

    auto secretStore = secretStore_;
    if (!secretStore && credentials.mode == OidcCredentials::Mode::StoredToken)
        secretStore = std::make_shared<KeychainSecretStore>();

    auto manager = std::make_shared<OidcTokenManager>(
        std::move(client), std::move(metadata), httpClient_, idpConfig_, secretStore);

    switch (credentials.mode) {
    case OidcCredentials::Mode::Interactive: {
        auto receiver = receiver_;
        if (!receiver)
            receiver = std::make_shared<LocalCallbackReceiver>();
        manager->authorizeInteractively(*receiver);
        break;
    }
    case OidcCredentials::Mode::RefreshToken:
        manager->authorizeWithRefreshToken(credentials.refreshToken);
        break;
    case OidcCredentials::Mode::StoredToken:
        manager->authorizeFromSecretStore();
        break;
    }

    return OidcStrategy(std::move(manager));
}

}
