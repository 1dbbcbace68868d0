#pragma once

#include "mutual-auth.hpp"

namespace httpauth
{

/**
 * Kerberos via GSSAPI, wrapped in SPNEGO for the Negotiate scheme.
 * Uses the default credential cache (kinit) and the service
 * principal HTTP@<host>. NTLM is not available.
 */
class GssapiMutualAuthProvider : public IMutualAuthProvider
{
public:
    bool supports(AuthScheme scheme) const override;

    std::unique_ptr<IMutualAuthContext> createContext(
        AuthScheme scheme,
        std::string const& targetHost) override;
};

}
