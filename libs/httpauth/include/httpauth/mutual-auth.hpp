#pragma once

#include <memory>
#include <optional>
#include <string>

#include "auth-scheme.hpp"

namespace httpauth
{

struct MutualAuthStep
{
    enum class Status
    {
        ContinueNeeded,
        Complete,
        Failed
    };

    Status status = Status::Failed;
    std::string token;    // base64 token for the Authorization header, may be empty
    std::string message;  // failure reason reported by the provider
};

/**
 * Security context of one NTLM/Negotiate handshake. Created per
 * request sequence, never shared between concurrent requests.
 */
class IMutualAuthContext
{
public:
    virtual ~IMutualAuthContext() = default;

    /**
     * Feed the server's token (absent on the first call) and obtain
     * the next client token.
     */
    virtual MutualAuthStep produceToken(std::optional<std::string> const& serverToken) = 0;
};

/**
 * OS credential material (Kerberos ticket cache, Windows SSO).
 */
class IMutualAuthProvider
{
public:
    virtual ~IMutualAuthProvider() = default;

    /** Only AuthScheme::Ntlm and AuthScheme::Negotiate are ever asked. */
    virtual bool supports(AuthScheme scheme) const = 0;

    /**
     * Throws HandshakeFailedError if no context can be acquired,
     * e.g. because there are no credentials.
     */
    virtual std::unique_ptr<IMutualAuthContext> createContext(
        AuthScheme scheme,
        std::string const& targetHost) = 0;
};

/**
 * Platform provider compiled into this build, or nullptr
 * if there is none.
 */
std::shared_ptr<IMutualAuthProvider> defaultMutualAuthProvider();

}
