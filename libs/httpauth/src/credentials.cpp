#include "credentials.hpp"
#include "mutual-auth.hpp"
#include "overloaded.hpp"

namespace httpauth
{

namespace
{

bool providerSupports(IMutualAuthProvider const* provider, AuthScheme scheme)
{
    return provider && provider->supports(scheme);
}

}

std::string schemeName(AuthScheme scheme)
{
    switch (scheme) {
    case AuthScheme::Anonymous: return "Anonymous";
    case AuthScheme::Basic: return "Basic";
    case AuthScheme::Ntlm: return "NTLM";
    case AuthScheme::Negotiate: return "Negotiate";
    case AuthScheme::Oidc: return "OIDC";
    }
    return "Unknown";
}

int precedence(AuthScheme scheme)
{
    return static_cast<int>(scheme);
}

std::string BasicCredentials::qualifiedUsername() const
{
    if (domain && !domain->empty())
        return *domain + "\\" + username;
    return username;
}

std::string credentialKind(CredentialConfig const& credentials)
{
    return std::visit(Overloaded {
        [](AnonymousCredentials const&) -> std::string { return "Anonymous"; },
        [](BasicCredentials const&) -> std::string { return "Basic"; },
        [](WindowsIntegratedCredentials const&) -> std::string { return "WindowsIntegrated"; },
        [](OidcCredentials const&) -> std::string { return "OIDC"; }
    }, credentials);
}

std::optional<AuthScheme> satisfiedScheme(
    CredentialConfig const& credentials,
    Challenge const& challenge,
    IMutualAuthProvider const* provider)
{
    return std::visit(Overloaded {
        [](AnonymousCredentials const&) -> std::optional<AuthScheme> {
            return {};
        },
        [&](BasicCredentials const&) -> std::optional<AuthScheme> {
            if (challenge.is("Basic"))
                return AuthScheme::Basic;
            return {};
        },
        [&](WindowsIntegratedCredentials const&) -> std::optional<AuthScheme> {
            if ((challenge.is("Negotiate") || challenge.is("Kerberos")) &&
                providerSupports(provider, AuthScheme::Negotiate))
                return AuthScheme::Negotiate;
            if (challenge.is("NTLM") && providerSupports(provider, AuthScheme::Ntlm))
                return AuthScheme::Ntlm;
            return {};
        },
        [&](OidcCredentials const&) -> std::optional<AuthScheme> {
            if (challenge.is("Bearer"))
                return AuthScheme::Oidc;
            return {};
        }
    }, credentials);
}

std::optional<SchemeSelection> selectScheme(
    CredentialConfig const& credentials,
    std::vector<Challenge> const& challenges,
    IMutualAuthProvider const* provider)
{
    std::optional<SchemeSelection> result;
    std::vector<AuthScheme> candidates;

    for (auto const& challenge : challenges) {
        auto scheme = satisfiedScheme(credentials, challenge, provider);
        if (!scheme)
            continue;
        candidates.push_back(*scheme);
        if (!result || precedence(*scheme) > precedence(result->scheme))
            result = SchemeSelection{*scheme, challenge, {}};
    }

    if (result)
        result->candidates = std::move(candidates);
    return result;
}

std::vector<std::string> advertisedSchemes(std::vector<Challenge> const& challenges)
{
    std::vector<std::string> result;
    for (auto const& challenge : challenges) {
        bool seen = false;
        for (auto const& name : result)
            seen = seen || equalsIgnoreCase(name, challenge.scheme);
        if (!seen)
            result.push_back(challenge.scheme);
    }
    return result;
}

}

#ifndef HTTPAUTH_GSSAPI_SUPPORT

namespace httpauth
{

std::shared_ptr<IMutualAuthProvider> defaultMutualAuthProvider()
{
    return nullptr;
}

}

#endif
