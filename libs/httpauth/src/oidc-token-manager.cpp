#include "oidc-token-manager.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "url.hpp"

#include <sstream>

#include <yaml-cpp/yaml.h>

#include "stx/format.h"
#include "stx/string.h"

using namespace std::chrono;

namespace httpauth
{

namespace
{

const char* IDP_ACCEPT = "application/json";
const char* IDP_CONTENT_TYPE = "application/x-www-form-urlencoded;charset=UTF-8";
const std::size_t CODE_VERIFIER_LENGTH = 64;
const std::size_t STATE_LENGTH = 32;

void replaceHeader(Headers& headers, std::string const& name, std::string const& value)
{
    headers.erase(name);
    headers.emplace(name, value);
}

/**
 * The identity provider only talks JSON, whatever the caller configured.
 */
SessionConfiguration identityProviderConfiguration(SessionConfiguration config, std::string const& audience)
{
    replaceHeader(config.headers, "Accept", IDP_ACCEPT);
    replaceHeader(config.headers, "Content-Type", IDP_CONTENT_TYPE);
    if (!audience.empty())
        replaceHeader(config.headers, "audience", audience);
    return config;
}

std::vector<std::string> splitScopes(std::string const& scope)
{
    std::vector<std::string> result;
    std::istringstream in(scope);
    std::string item;
    while (in >> item)
        result.push_back(item);
    return result;
}

bool isInvalidGrant(Response const& response)
{
    try {
        auto document = YAML::Load(response.content);
        if (document.IsMap())
            if (auto error = document["error"])
                return error.as<std::string>() == "invalid_grant";
    }
    catch (YAML::Exception const& e) {
        log().debug("[OIDC] Token endpoint error body is not JSON: {}", e.what());
    }
    return false;
}

}

std::string stateName(OidcTokenManager::State state)
{
    switch (state) {
    case OidcTokenManager::State::NoToken: return "NoToken";
    case OidcTokenManager::State::Authorizing: return "Authorizing";
    case OidcTokenManager::State::Authorized: return "Authorized";
    case OidcTokenManager::State::Refreshing: return "Refreshing";
    case OidcTokenManager::State::Expired: return "Expired";
    }
    return "Unknown";
}

IdentityProviderMetadata IdentityProviderMetadata::discover(
    IHttpClient& client,
    std::string const& authority,
    SessionConfiguration const& idpConfig)
{
    auto base = authority;
    if (base.empty() || base.back() != '/')
        base.push_back('/');

    Request request;
    request.url = base + ".well-known/openid-configuration";
    log().info("[OIDC] Fetching identity provider configuration from {} ...", request.url);

    auto response = client.send(request, identityProviderConfiguration(idpConfig, {}));
    if (!response.isSuccess())
        throw logRuntimeError<ConnectionError>(stx::format(
            "Identity provider configuration at {} returned status {}.", request.url, response.status),
            response.status);

    YAML::Node document;
    try {
        document = YAML::Load(response.content);
    }
    catch (YAML::Exception const& e) {
        throw logRuntimeError<ConnectionError>(stx::format(
            "Identity provider configuration at {} is not JSON: {}", request.url, e.what()));
    }
    if (!document.IsMap())
        throw logRuntimeError<ConnectionError>(stx::format(
            "Identity provider configuration at {} is not a JSON object.", request.url));

    std::vector<std::string> missing;
    for (auto const* key : {"authorization_endpoint", "token_endpoint"}) {
        if (!document[key])
            missing.emplace_back(key);
    }
    if (!missing.empty())
        throw logRuntimeError<ConnectionError>(stx::format(
            "Identity provider configuration lacks mandatory parameter(s) '{}'.",
            stx::join(missing.begin(), missing.end(), "', '")));

    IdentityProviderMetadata result;
    result.authorizationEndpoint = document["authorization_endpoint"].as<std::string>();
    result.tokenEndpoint = document["token_endpoint"].as<std::string>();
    if (auto issuer = document["issuer"])
        result.issuer = issuer.as<std::string>();

    for (auto const* endpoint : {&result.authorizationEndpoint, &result.tokenEndpoint}) {
        if (!Url::isUriText(*endpoint))
            throw logRuntimeError<ConnectionError>(stx::format(
                "Identity provider configuration has a malformed endpoint URL '{}'.", *endpoint));
    }

    log().debug("  ... authorization_endpoint={}, token_endpoint={}",
                result.authorizationEndpoint, result.tokenEndpoint);
    return result;
}

OidcClientConfig OidcClientConfig::resolve(
    OidcCredentials const& credentials,
    Challenge const* bearerChallenge)
{
    auto fromChallenge = [&](char const* name) -> std::string {
        if (bearerChallenge)
            if (auto value = bearerChallenge->parameter(name))
                return *value;
        return {};
    };
    auto pick = [](std::string const& explicitValue, std::string challengeValue) {
        return explicitValue.empty() ? std::move(challengeValue) : explicitValue;
    };

    OidcClientConfig result;
    result.authority = pick(credentials.authority, fromChallenge("authority"));
    result.clientId = pick(credentials.clientId, fromChallenge("clientid"));
    result.redirectUri = pick(credentials.redirectUri, fromChallenge("redirecturi"));
    result.audience = pick(credentials.audience, fromChallenge("apiAudience"));
    result.scopes = credentials.scopes.empty() ? splitScopes(fromChallenge("scope")) : credentials.scopes;
    result.loginTimeout = credentials.loginTimeout;

    std::vector<std::string> missing;
    if (result.authority.empty())
        missing.emplace_back("authority");
    if (result.clientId.empty())
        missing.emplace_back("clientid");
    if (result.redirectUri.empty())
        missing.emplace_back("redirecturi");
    if (!missing.empty())
        throw logRuntimeError<ConfigurationError>(stx::format(
            "Cannot use OpenID Connect: mandatory parameter(s) '{}' neither configured nor advertised by the server.",
            stx::join(missing.begin(), missing.end(), "', '")));

    result.clientSecret = credentials.clientSecret;
    if (result.clientSecret.empty() && !credentials.clientSecretKeychain.empty())
        result.clientSecret = KeychainSecretStore::loadPassword(credentials.clientSecretKeychain, result.clientId);

    return result;
}

OidcTokenManager::OidcTokenManager(
    OidcClientConfig client,
    IdentityProviderMetadata metadata,
    std::shared_ptr<IHttpClient> httpClient,
    SessionConfiguration const& idpConfig,
    std::shared_ptr<ISecretStore> secretStore,
    Clock clock)
    : client_(std::move(client))
    , metadata_(std::move(metadata))
    , httpClient_(std::move(httpClient))
    , idpConfig_(identityProviderConfiguration(idpConfig, client_.audience))
    , secretStore_(std::move(secretStore))
    , clock_(std::move(clock))
{
    if (!clock_)
        clock_ = []() { return OidcToken::Clock::now(); };
}

OidcTokenManager::State OidcTokenManager::state() const
{
    std::lock_guard lock(mutex_);
    return state_;
}

std::optional<OidcToken> OidcTokenManager::token() const
{
    std::lock_guard lock(mutex_);
    return token_;
}

OidcToken::Clock::time_point OidcTokenManager::now() const
{
    return clock_();
}

void OidcTokenManager::authorizeInteractively(IAuthorizationCodeReceiver& receiver)
{
    State previousState;
    {
        std::lock_guard lock(mutex_);
        previousState = state_;
        state_ = State::Authorizing;
    }

    try {
        auto codeVerifier = randomUrlSafeString(CODE_VERIFIER_LENGTH);
        auto state = randomUrlSafeString(STATE_LENGTH);

        auto url = Url::parse(metadata_.authorizationEndpoint);
        url.addQuery("response_type", "code");
        url.addQuery("client_id", client_.clientId);
        url.addQuery("redirect_uri", client_.redirectUri);
        if (!client_.scopes.empty())
            url.addQuery("scope", stx::join(client_.scopes.begin(), client_.scopes.end(), " "));
        url.addQuery("state", state);
        url.addQuery("code_challenge", pkceChallenge(codeVerifier));
        url.addQuery("code_challenge_method", "S256");
        if (!client_.audience.empty())
            url.addQuery("audience", client_.audience);

        log().info("[OIDC] Starting interactive authorization for client {} ...", client_.clientId);
        auto response = receiver.receive({url.build(), client_.redirectUri, state, client_.loginTimeout});

        if (!response.error.empty())
            throw logRuntimeError<AuthorizationError>(stx::format(
                "Identity provider refused the authorization: {} {}", response.error, response.errorDescription));
        if (response.state != state)
            throw logRuntimeError<AuthorizationError>(
                "Authorization redirect does not belong to this login (state mismatch).");
        if (response.code.empty())
            throw logRuntimeError<AuthorizationError>("Authorization redirect carries no code.");

        adopt(exchangeCode(response.code, codeVerifier));
        log().info("  ... authorized.");
    }
    catch (Error const&) {
        std::lock_guard lock(mutex_);
        state_ = previousState;
        throw;
    }
}

void OidcTokenManager::authorizeWithRefreshToken(std::string const& refreshToken)
{
    if (refreshToken.empty())
        throw logRuntimeError<ConfigurationError>("OIDC refresh token mode requires a refresh token.");

    {
        std::lock_guard lock(mutex_);
        state_ = State::Authorizing;
    }

    try {
        log().info("[OIDC] Redeeming provided refresh token for client {} ...", client_.clientId);
        adopt(requestRefresh(refreshToken));
        log().info("  ... authorized.");
    }
    catch (ReauthenticationRequiredError const&) {
        std::lock_guard lock(mutex_);
        state_ = State::Expired;
        throw;
    }
    catch (Error const&) {
        std::lock_guard lock(mutex_);
        state_ = State::NoToken;
        throw;
    }
}

void OidcTokenManager::authorizeFromSecretStore()
{
    if (!secretStore_)
        throw logRuntimeError<ConfigurationError>("OIDC stored token mode requires a secret store.");

    auto stored = loadStored();
    if (!stored)
        throw logRuntimeError<ReauthenticationRequiredError>(stx::format(
            "No stored OIDC token for {}.", secretStoreKey(client_.authority, client_.clientId)));

    log().info("[OIDC] Using stored token for client {}.", client_.clientId);
    bool needsRefresh;
    {
        std::lock_guard lock(mutex_);
        token_ = stored;
        state_ = State::Authorized;
        needsRefresh = token_->needsRefresh(now(), skew_);
    }

    if (needsRefresh)
        validAccessToken();
}

std::string OidcTokenManager::validAccessToken()
{
    std::unique_lock lock(mutex_);
    if (state_ == State::Expired)
        throw logRuntimeError<ReauthenticationRequiredError>(
            "OIDC token expired, interactive authorization required.");
    if (!token_)
        throw logRuntimeError<ReauthenticationRequiredError>(stx::format(
            "No OIDC token available (state {}).", stateName(state_)));

    if (state_ != State::Refreshing && !token_->needsRefresh(now(), skew_))
        return token_->accessToken;
    return awaitRefresh(lock);
}

std::string OidcTokenManager::forceRefresh(std::string const& rejectedAccessToken)
{
    std::unique_lock lock(mutex_);
    if (state_ == State::Expired)
        throw logRuntimeError<ReauthenticationRequiredError>(
            "OIDC token expired, interactive authorization required.");
    if (!token_)
        throw logRuntimeError<ReauthenticationRequiredError>(stx::format(
            "No OIDC token available (state {}).", stateName(state_)));

    if (state_ != State::Refreshing && token_->accessToken != rejectedAccessToken) {
        log().debug("[OIDC] Rejected token was already replaced.");
        return token_->accessToken;
    }
    log().debug("[OIDC] Access token was rejected by the server.");
    return awaitRefresh(lock);
}

void OidcTokenManager::setSkew(std::chrono::seconds skew)
{
    std::lock_guard lock(mutex_);
    skew_ = skew;
}

std::chrono::seconds OidcTokenManager::skew() const
{
    std::lock_guard lock(mutex_);
    return skew_;
}

std::string OidcTokenManager::awaitRefresh(std::unique_lock<std::mutex>& lock)
{
    if (inFlight_.valid()) {
        auto pending = inFlight_;
        lock.unlock();
        log().debug("[OIDC] Waiting for refresh in progress ...");
        if (pending.wait_for(2 * idpConfig_.timeout()) == std::future_status::timeout)
            throw logRuntimeError<TimeoutError>("Timed out waiting for the OIDC token refresh.");
        return pending.get().accessToken;
    }

    std::promise<OidcToken> promise;
    inFlight_ = promise.get_future().share();
    state_ = State::Refreshing;
    auto current = *token_;
    lock.unlock();

    log().debug("[OIDC] Refreshing access token ...");
    try {
        auto refreshed = refreshOrAdopt(current);
        lock.lock();
        token_ = refreshed;
        state_ = State::Authorized;
        inFlight_ = {};
        lock.unlock();

        persist(refreshed);
        promise.set_value(refreshed);
        log().debug("  ... refresh successful.");
        return refreshed.accessToken;
    }
    catch (ReauthenticationRequiredError const&) {
        lock.lock();
        state_ = State::Expired;
        inFlight_ = {};
        lock.unlock();

        forgetStored();
        promise.set_exception(std::current_exception());
        throw;
    }
    catch (std::exception const& e) {
        lock.lock();
        state_ = State::Authorized;
        inFlight_ = {};
        lock.unlock();

        log().debug("  ... refresh failed: {}", e.what());
        promise.set_exception(std::current_exception());
        throw;
    }
}

OidcToken OidcTokenManager::refreshOrAdopt(OidcToken const& current)
{
    if (auto stored = loadStored()) {
        if (stored->accessToken != current.accessToken && !stored->needsRefresh(now(), skew())) {
            log().debug("[OIDC] Adopting token refreshed by another client.");
            return *stored;
        }
    }

    if (current.refreshToken.empty())
        throw logRuntimeError<ReauthenticationRequiredError>(
            "OIDC access token expired and no refresh token was issued.");
    return requestRefresh(current.refreshToken);
}

OidcToken OidcTokenManager::requestRefresh(std::string const& refreshToken)
{
    // No audience here: some providers then drop it from the token.
    auto response = postToTokenEndpoint({
        {"grant_type", "refresh_token"},
        {"refresh_token", refreshToken}});

    if (response.isSuccess())
        return OidcToken::fromTokenResponse(response.content, now(), refreshToken);

    log().trace("[OIDC]   Error response: {}", response.content);
    if (response.status == 400 || response.status == 401 || isInvalidGrant(response))
        throw logRuntimeError<ReauthenticationRequiredError>(stx::format(
            "Refresh token was rejected by the identity provider (status {}).", response.status));
    throw logRuntimeError<ConnectionError>(stx::format(
        "Token refresh failed with status {}.", response.status), response.status);
}

OidcToken OidcTokenManager::exchangeCode(std::string const& code, std::string const& codeVerifier)
{
    std::multimap<std::string, std::string> fields{
        {"grant_type", "authorization_code"},
        {"code", code},
        {"redirect_uri", client_.redirectUri},
        {"code_verifier", codeVerifier}};
    if (!client_.audience.empty())
        fields.emplace("audience", client_.audience);

    auto response = postToTokenEndpoint(std::move(fields));
    if (response.status >= 500)
        throw logRuntimeError<ConnectionError>(stx::format(
            "Authorization code exchange failed with status {}.", response.status), response.status);
    if (!response.isSuccess()) {
        log().trace("[OIDC]   Error response: {}", response.content);
        throw logRuntimeError<AuthorizationError>(stx::format(
            "Identity provider rejected the authorization code (status {}).", response.status));
    }
    return OidcToken::fromTokenResponse(response.content, now());
}

Response OidcTokenManager::postToTokenEndpoint(std::multimap<std::string, std::string> fields)
{
    Request request;
    request.method = "POST";
    request.url = metadata_.tokenEndpoint;

    if (client_.clientSecret.empty())
        fields.emplace("client_id", client_.clientId);
    else
        request.headers.emplace("Authorization", "Basic " + base64Encode(client_.clientId + ":" + client_.clientSecret));

    auto grantType = fields.find("grant_type")->second;
    request.body = BodyAndContentType{Url::formEncode(fields), IDP_CONTENT_TYPE};

    log().debug("[OIDC] Requesting token: grant_type={}, url={}", grantType, request.url);
    auto response = httpClient_->send(request, idpConfig_);
    log().debug("[OIDC] Token endpoint response: status={}, body_size={}", response.status, response.content.size());
    return response;
}

void OidcTokenManager::adopt(OidcToken token)
{
    {
        std::lock_guard lock(mutex_);
        token_ = token;
        state_ = State::Authorized;
    }
    persist(token);
}

std::optional<OidcToken> OidcTokenManager::loadStored() const
{
    if (!secretStore_)
        return {};

    try {
        if (auto json = secretStore_->get(secretStoreKey(client_.authority, client_.clientId)))
            return OidcToken::fromJson(*json);
    }
    catch (Error const& e) {
        log().warn("[OIDC] Ignoring stored token: {}", e.what());
    }
    return {};
}

void OidcTokenManager::persist(OidcToken const& token) const
{
    if (!secretStore_)
        return;

    try {
        secretStore_->set(secretStoreKey(client_.authority, client_.clientId), token.toJson());
    }
    catch (Error const& e) {
        log().warn("[OIDC] Could not store token: {}", e.what());
    }
}

void OidcTokenManager::forgetStored() const
{
    if (!secretStore_)
        return;

    try {
        secretStore_->remove(secretStoreKey(client_.authority, client_.clientId));
    }
    catch (Error const& e) {
        log().warn("[OIDC] Could not remove stored token: {}", e.what());
    }
}

}
