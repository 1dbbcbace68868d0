#pragma once

#include <string>

namespace httpauth
{

/**
 * Schemes a session can be negotiated to, in ascending precedence.
 */
enum class AuthScheme
{
    Anonymous,
    Basic,
    Ntlm,
    Negotiate,
    Oidc
};

/** "Anonymous", "Basic", "NTLM", "Negotiate" or "OIDC". */
std::string schemeName(AuthScheme scheme);

/**
 * Higher wins when more than one advertised scheme is satisfiable.
 */
int precedence(AuthScheme scheme);

}
