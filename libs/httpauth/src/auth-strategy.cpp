#include "auth-strategy.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "overloaded.hpp"
#include "secret-store.hpp"
#include "url.hpp"

#include "stx/format.h"

namespace httpauth
{

namespace
{

void setHeader(Request& request, std::string const& name, std::string const& value)
{
    request.headers.erase(name);
    request.headers.emplace(name, value);
}

/**
 * Token68 of the server's challenge for `scheme`, if any.
 */
std::optional<std::string> serverToken(Response const& response, std::string const& scheme)
{
    auto header = response.status == 407 ? "Proxy-Authenticate" : "WWW-Authenticate";
    for (auto const& challenge : parseChallenges(response.headerValues(header))) {
        if (challenge.is(scheme) && challenge.token68)
            return challenge.token68;
    }
    return {};
}

bool offersScheme(Response const& response, std::string const& scheme)
{
    auto header = response.status == 407 ? "Proxy-Authenticate" : "WWW-Authenticate";
    for (auto const& challenge : parseChallenges(response.headerValues(header))) {
        if (challenge.is(scheme))
            return true;
    }
    return false;
}

void applyStep(MutualAuthStep step, AuthAttempt& attempt, std::string const& scheme)
{
    if (step.status == MutualAuthStep::Status::Failed)
        throw logRuntimeError<HandshakeFailedError>(stx::format(
            "{} handshake failed: {}", scheme, step.message));
    attempt.outgoingToken = std::move(step.token);
    attempt.handshakeComplete = step.status == MutualAuthStep::Status::Complete;
}

}

BasicStrategy::BasicStrategy(BasicCredentials const& credentials)
    : username_(credentials.qualifiedUsername())
{
    auto password = credentials.password;
    if (password.empty() && !credentials.keychain.empty())
        password = KeychainSecretStore::loadPassword(credentials.keychain, credentials.username);
    authorization_ = "Basic " + base64Encode(username_ + ":" + password);
}

void BasicStrategy::prepareRequest(Request& request, AuthAttempt&) const
{
    setHeader(request, "Authorization", authorization_);
}

MutualAuthStrategy::MutualAuthStrategy(
    AuthScheme scheme,
    std::string headerScheme,
    std::shared_ptr<IMutualAuthProvider> provider)
    : scheme_(scheme)
    , headerScheme_(std::move(headerScheme))
    , provider_(std::move(provider))
{
    if (!provider_)
        throw logRuntimeError<ConfigurationError>(stx::format(
            "{} requires a mutual authentication provider.", schemeName(scheme_)));
}

void MutualAuthStrategy::prepareRequest(Request& request, AuthAttempt& attempt) const
{
    if (!attempt.context) {
        auto target = attempt.proxyHop && !attempt.proxyHost.empty()
            ? attempt.proxyHost
            : Url::parse(request.url).host;
        attempt.context = provider_->createContext(scheme_, target);
        applyStep(attempt.context->produceToken(std::nullopt), attempt, headerScheme_);
    }

    if (!attempt.outgoingToken.empty())
        setHeader(request,
                  attempt.proxyHop ? "Proxy-Authorization" : "Authorization",
                  headerScheme_ + " " + attempt.outgoingToken);
}

ResponseAction MutualAuthStrategy::handleResponse(Response const& response, AuthAttempt& attempt) const
{
    if (!attempt.context)
        return ResponseAction::Done;

    // The first 407 restarts the handshake against the proxy.
    if (response.status == 407 && !attempt.proxyHop) {
        if (!offersScheme(response, headerScheme_)) {
            log().warn("Proxy does not offer {} authentication.", headerScheme_);
            return ResponseAction::Done;
        }
        log().debug("Proxy requests {} authentication.", headerScheme_);
        attempt.proxyHop = true;
        attempt.context.reset();
        attempt.outgoingToken.clear();
        attempt.round = 0;
        attempt.handshakeComplete = false;
        return ResponseAction::Retry;
    }

    auto token = serverToken(response, headerScheme_);

    if (response.status == 401 || response.status == 407) {
        if (!token) {
            log().warn("{} credentials were rejected by {}.", headerScheme_, response.url);
            return ResponseAction::Done;
        }
        if (++attempt.round > MAX_HANDSHAKE_ROUNDS)
            throw logRuntimeError<HandshakeFailedError>(stx::format(
                "{} handshake did not complete within {} rounds.", headerScheme_, MAX_HANDSHAKE_ROUNDS));

        log().debug("{} handshake round {} ...", headerScheme_, attempt.round);
        applyStep(attempt.context->produceToken(token), attempt, headerScheme_);
        if (attempt.outgoingToken.empty())
            throw logRuntimeError<HandshakeFailedError>(stx::format(
                "{} handshake produced no continuation token.", headerScheme_));
        return ResponseAction::Retry;
    }

    // Mutual authentication: the server proves its identity with a final token.
    if (token && response.isSuccess() && !attempt.handshakeComplete) {
        applyStep(attempt.context->produceToken(token), attempt, headerScheme_);
        log().debug("{} server token verified.", headerScheme_);
    }
    return ResponseAction::Done;
}

NtlmStrategy::NtlmStrategy(std::shared_ptr<IMutualAuthProvider> provider)
    : MutualAuthStrategy(AuthScheme::Ntlm, "NTLM", std::move(provider))
{}

NegotiateStrategy::NegotiateStrategy(std::shared_ptr<IMutualAuthProvider> provider, std::string headerScheme)
    : MutualAuthStrategy(AuthScheme::Negotiate, std::move(headerScheme), std::move(provider))
{}

OidcStrategy::OidcStrategy(std::shared_ptr<OidcTokenManager> tokenManager)
    : tokenManager_(std::move(tokenManager))
{}

void OidcStrategy::prepareRequest(Request& request, AuthAttempt& attempt) const
{
    attempt.accessToken = tokenManager_->validAccessToken();
    setHeader(request, "Authorization", "Bearer " + attempt.accessToken);

    auto const& audience = tokenManager_->client().audience;
    if (!audience.empty())
        setHeader(request, "audience", audience);
}

ResponseAction OidcStrategy::handleResponse(Response const& response, AuthAttempt& attempt) const
{
    if (response.status != 401)
        return ResponseAction::Done;

    if (attempt.retriedAfterRefresh) {
        log().warn("[OIDC] {} rejected a freshly refreshed token.", response.url);
        return ResponseAction::Done;
    }

    attempt.retriedAfterRefresh = true;
    tokenManager_->forceRefresh(attempt.accessToken);
    return ResponseAction::Retry;
}

AuthScheme strategyScheme(AuthStrategy const& strategy)
{
    return std::visit([](auto const& s) { return s.scheme(); }, strategy);
}

void prepareRequest(AuthStrategy const& strategy, Request& request, AuthAttempt& attempt)
{
    std::visit(Overloaded {
        [&](AnonymousStrategy const& s) { s.prepareRequest(request, attempt); },
        [&](BasicStrategy const& s) { s.prepareRequest(request, attempt); },
        [&](NtlmStrategy const& s) { s.prepareRequest(request, attempt); },
        [&](NegotiateStrategy const& s) { s.prepareRequest(request, attempt); },
        [&](OidcStrategy const& s) { s.prepareRequest(request, attempt); }
    }, strategy);
}

ResponseAction handleResponse(AuthStrategy const& strategy, Response const& response, AuthAttempt& attempt)
{
    return std::visit(Overloaded {
        [&](AnonymousStrategy const& s) { return s.handleResponse(response, attempt); },
        [&](BasicStrategy const& s) { return s.handleResponse(response, attempt); },
        [&](NtlmStrategy const& s) { return s.handleResponse(response, attempt); },
        [&](NegotiateStrategy const& s) { return s.handleResponse(response, attempt); },
        [&](OidcStrategy const& s) { return s.handleResponse(response, attempt); }
    }, strategy);
}

}
