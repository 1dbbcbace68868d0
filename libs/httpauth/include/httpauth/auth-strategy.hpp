#pragma once

#include <memory>
#include <string>
#include <variant>

#include "auth-scheme.hpp"
#include "credentials.hpp"
#include "http-client.hpp"
#include "mutual-auth.hpp"
#include "oidc-token-manager.hpp"

namespace httpauth
{

/**
 * Authentication state of one logical request (including its retries).
 * Created by Session::send() per call, never shared.
 */
struct AuthAttempt
{
    // NTLM/Negotiate
    std::unique_ptr<IMutualAuthContext> context;
    std::string outgoingToken;
    int round = 0;
    bool handshakeComplete = false;
    bool proxyHop = false;      // a 407 moved the handshake to the proxy
    std::string proxyHost;      // handshake target for proxyHop, if known

    // OIDC
    std::string accessToken;
    bool retriedAfterRefresh = false;
};

enum class ResponseAction
{
    Done,
    Retry
};

class AnonymousStrategy
{
public:
    AuthScheme scheme() const { return AuthScheme::Anonymous; }
    void prepareRequest(Request&, AuthAttempt&) const {}
    ResponseAction handleResponse(Response const&, AuthAttempt&) const { return ResponseAction::Done; }
};

class BasicStrategy
{
public:
    /**
     * Loads a keychain password right away.
     */
    explicit BasicStrategy(BasicCredentials const& credentials);

    AuthScheme scheme() const { return AuthScheme::Basic; }
    void prepareRequest(Request& request, AuthAttempt&) const;
    ResponseAction handleResponse(Response const&, AuthAttempt&) const { return ResponseAction::Done; }

    std::string const& username() const { return username_; }

private:
    std::string username_;
    std::string authorization_;
};

/**
 * Multi-round handshake driven by an IMutualAuthProvider. The first
 * token is sent with the first request; every 401/407 carrying a
 * server token yields one more round, up to MAX_HANDSHAKE_ROUNDS.
 */
class MutualAuthStrategy
{
public:
    static constexpr int MAX_HANDSHAKE_ROUNDS = 3;

    AuthScheme scheme() const { return scheme_; }
    void prepareRequest(Request& request, AuthAttempt& attempt) const;
    ResponseAction handleResponse(Response const& response, AuthAttempt& attempt) const;

    /** Scheme token used in the Authorization header. */
    std::string const& headerScheme() const { return headerScheme_; }

protected:
    MutualAuthStrategy(AuthScheme scheme,
                       std::string headerScheme,
                       std::shared_ptr<IMutualAuthProvider> provider);

private:
    AuthScheme scheme_;
    std::string headerScheme_;
    std::shared_ptr<IMutualAuthProvider> provider_;
};

class NtlmStrategy : public MutualAuthStrategy
{
public:
    explicit NtlmStrategy(std::shared_ptr<IMutualAuthProvider> provider);
};

class NegotiateStrategy : public MutualAuthStrategy
{
public:
    /**
     * @param headerScheme "Negotiate", or "Kerberos" if the server
     *  advertised that spelling.
     */
    explicit NegotiateStrategy(std::shared_ptr<IMutualAuthProvider> provider,
                               std::string headerScheme = "Negotiate");
};

/**
 * Bearer token from an OidcTokenManager. A 401 is answered with
 * one forced refresh; a second 401 is passed to the caller.
 */
class OidcStrategy
{
public:
    explicit OidcStrategy(std::shared_ptr<OidcTokenManager> tokenManager);

    AuthScheme scheme() const { return AuthScheme::Oidc; }
    void prepareRequest(Request& request, AuthAttempt& attempt) const;
    ResponseAction handleResponse(Response const& response, AuthAttempt& attempt) const;

    OidcTokenManager& tokenManager() const { return *tokenManager_; }

private:
    std::shared_ptr<OidcTokenManager> tokenManager_;
};

using AuthStrategy = std::variant<
    AnonymousStrategy,
    BasicStrategy,
    NtlmStrategy,
    NegotiateStrategy,
    OidcStrategy>;

AuthScheme strategyScheme(AuthStrategy const& strategy);

/**
 * Attach credentials to an outgoing request.
 */
void prepareRequest(AuthStrategy const& strategy, Request& request, AuthAttempt& attempt);

/**
 * Inspect a response. Retry means: prepare and send the same request again.
 */
ResponseAction handleResponse(AuthStrategy const& strategy, Response const& response, AuthAttempt& attempt);

}
