#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace httpauth
{

/**
 * Common base of all errors raised by httpauth. Catch the derived
 * types to tell configuration mistakes, network trouble and
 * re-authentication demands apart.
 */
struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/**
 * The caller misused the session builder, or the configuration
 * is incomplete. Not retryable.
 */
struct ConfigurationError : Error {
    using Error::Error;
};

/**
 * Transport failure, or an unexpected HTTP status where a
 * negotiation step needed a specific answer.
 */
struct ConnectionError : Error {
    using Error::Error;

    ConnectionError(std::string const& what, int status)
        : Error(what)
        , status(status)
    {}

    /** HTTP status, if the server answered at all. */
    std::optional<int> status;
};

/**
 * A bounded operation (probe, token exchange, interactive login)
 * exceeded its deadline.
 */
struct TimeoutError : Error {
    using Error::Error;
};

/**
 * The schemes advertised by the server and the configured
 * credential do not intersect. Terminal for the builder.
 */
struct AuthenticationMismatchError : Error {
    AuthenticationMismatchError(std::string const& what,
                                std::string configuredScheme,
                                std::vector<std::string> advertisedSchemes)
        : Error(what)
        , configuredScheme_(std::move(configuredScheme))
        , advertisedSchemes_(std::move(advertisedSchemes))
    {}

    std::string const& configuredScheme() const { return configuredScheme_; }
    std::vector<std::string> const& advertisedSchemes() const { return advertisedSchemes_; }

private:
    std::string configuredScheme_;
    std::vector<std::string> advertisedSchemes_;
};

/**
 * The OIDC refresh token was rejected (or there is no token at all).
 * The caller has to run an interactive authorization again.
 */
struct ReauthenticationRequiredError : Error {
    using Error::Error;
};

/**
 * The identity provider refused an interactive authorization,
 * or the redirect did not belong to the request we issued.
 */
struct AuthorizationError : Error {
    using Error::Error;
};

/**
 * NTLM/Negotiate handshake failed, either reported by the
 * mutual-auth provider or by exceeding the round limit.
 */
struct HandshakeFailedError : Error {
    using Error::Error;
};

}
