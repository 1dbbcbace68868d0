#include "oidc-token.hpp"
#include "errors.hpp"

#include <yaml-cpp/yaml.h>

#include "stx/format.h"

using namespace std::chrono;

namespace httpauth
{

std::string OidcToken::toJson() const
{
    // A flow map with double-quoted strings is valid JSON.
    YAML::Emitter out;
    out.SetStringFormat(YAML::DoubleQuoted);
    out << YAML::Flow << YAML::BeginMap;
    out << YAML::Key << "access_token" << YAML::Value << accessToken;
    out << YAML::Key << "refresh_token" << YAML::Value << refreshToken;
    out << YAML::Key << "expires_at"
        << YAML::Value << duration_cast<seconds>(expiresAt.time_since_epoch()).count();
    out << YAML::EndMap;
    return out.c_str();
}

OidcToken OidcToken::fromJson(std::string const& json)
{
    try {
        auto node = YAML::Load(json);
        OidcToken token;
        token.accessToken = node["access_token"].as<std::string>();
        if (auto refreshToken = node["refresh_token"])
            token.refreshToken = refreshToken.as<std::string>();
        token.expiresAt = Clock::time_point(seconds(node["expires_at"].as<long long>()));
        if (token.accessToken.empty())
            throw Error("empty access_token");
        return token;
    }
    catch (YAML::Exception const& e) {
        throw Error(stx::format("Stored OIDC token is malformed: {}", e.what()));
    }
}

OidcToken OidcToken::fromTokenResponse(
    std::string const& body,
    Clock::time_point issuedAt,
    std::string const& previousRefreshToken)
{
    YAML::Node document;
    try {
        document = YAML::Load(body);
    }
    catch (YAML::Exception const& e) {
        throw ConnectionError(stx::format("Token endpoint response is not JSON: {}", e.what()));
    }

    if (!document.IsMap())
        throw ConnectionError("Token endpoint response is not a JSON object.");

    try {
        OidcToken token;
        if (auto accessToken = document["access_token"])
            token.accessToken = accessToken.as<std::string>();
        if (token.accessToken.empty())
            throw ConnectionError("access_token missing in token endpoint response.");

        auto expiresIn = DEFAULT_EXPIRES_IN;
        if (auto expiresInNode = document["expires_in"])
            expiresIn = seconds(expiresInNode.as<long long>());
        token.expiresAt = issuedAt + expiresIn;

        if (auto refreshToken = document["refresh_token"])
            token.refreshToken = refreshToken.as<std::string>();
        else
            token.refreshToken = previousRefreshToken;
        return token;
    }
    catch (YAML::Exception const& e) {
        throw ConnectionError(stx::format("Malformed token endpoint response: {}", e.what()));
    }
}

std::string secretStoreKey(std::string const& authority, std::string const& clientId)
{
    auto normalized = authority;
    while (!normalized.empty() && normalized.back() == '/')
        normalized.pop_back();
    return normalized + "#" + clientId;
}

}
