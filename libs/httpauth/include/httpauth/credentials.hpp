#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "auth-scheme.hpp"
#include "challenge.hpp"

namespace httpauth
{

class IMutualAuthProvider;

struct AnonymousCredentials
{};

struct BasicCredentials
{
    std::string username;
    std::string password;
    std::optional<std::string> domain;

    /** Keychain service holding the password, if `password` is empty. */
    std::string keychain;

    /** `DOMAIN\user` if a domain is set, else the plain user name. */
    std::string qualifiedUsername() const;
};

/**
 * Use the current user's OS login (Kerberos or NTLM).
 */
struct WindowsIntegratedCredentials
{};

struct OidcCredentials
{
    static constexpr std::chrono::seconds DEFAULT_LOGIN_TIMEOUT{60};

    enum class Mode
    {
        Interactive,   // authorization code flow in the browser
        RefreshToken,  // redeem `refreshToken`
        StoredToken    // token from the secret store
    };

    // Empty fields are taken from the server's Bearer challenge.
    std::string authority;
    std::string clientId;
    std::string redirectUri;
    std::vector<std::string> scopes;
    std::string audience;

    std::string clientSecret;
    std::string clientSecretKeychain;

    Mode mode = Mode::Interactive;
    std::string refreshToken;
    std::chrono::seconds loginTimeout = DEFAULT_LOGIN_TIMEOUT;
};

using CredentialConfig = std::variant<
    AnonymousCredentials,
    BasicCredentials,
    WindowsIntegratedCredentials,
    OidcCredentials>;

/** "Anonymous", "Basic", "WindowsIntegrated" or "OIDC". */
std::string credentialKind(CredentialConfig const& credentials);

/**
 * The scheme this credential would use to answer the challenge,
 * if it can answer it at all. NTLM and Negotiate are only answerable
 * if the provider supports them.
 */
std::optional<AuthScheme> satisfiedScheme(
    CredentialConfig const& credentials,
    Challenge const& challenge,
    IMutualAuthProvider const* provider);

struct SchemeSelection
{
    AuthScheme scheme;
    Challenge challenge;

    /** All satisfiable schemes, in advertised order. */
    std::vector<AuthScheme> candidates;
};

/**
 * Pick the highest-precedence challenge the credential can answer.
 * For equal schemes the first advertised challenge wins.
 */
std::optional<SchemeSelection> selectScheme(
    CredentialConfig const& credentials,
    std::vector<Challenge> const& challenges,
    IMutualAuthProvider const* provider);

/**
 * Advertised scheme names, as spelled by the server,
 * without case-insensitive duplicates.
 */
std::vector<std::string> advertisedSchemes(std::vector<Challenge> const& challenges);

}
