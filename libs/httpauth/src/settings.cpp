#include "settings.hpp"
#include "session-configuration-yaml.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <cstdlib>
#include <filesystem>

#include <yaml-cpp/yaml.h>

#include "stx/format.h"

using httpauth::BasicCredentials;
using httpauth::OidcCredentials;

namespace YAML
{

template <>
struct convert<BasicCredentials>
{
    static bool decode(Node const& node, BasicCredentials& basic)
    {
        if (!node.IsMap())
            return false;

        auto const& user = node["user"];
        if (!user)
            return false;
        basic.username = user.as<std::string>();

        if (auto const& password = node["password"])
            basic.password = password.as<std::string>();
        else if (auto const& keychain = node["keychain"])
            basic.keychain = keychain.as<std::string>();
        else
            return false;

        if (auto const& domain = node["domain"])
            basic.domain = domain.as<std::string>();
        return true;
    }
};

template <>
struct convert<OidcCredentials::Mode>
{
    static bool decode(Node const& node, OidcCredentials::Mode& mode)
    {
        auto value = node.as<std::string>();
        if (value == "interactive")
            mode = OidcCredentials::Mode::Interactive;
        else if (value == "refresh-token")
            mode = OidcCredentials::Mode::RefreshToken;
        else if (value == "stored-token")
            mode = OidcCredentials::Mode::StoredToken;
        else
            return false;
        return true;
    }
};

template <>
struct convert<OidcCredentials>
{
    static bool decode(Node const& node, OidcCredentials& oidc)
    {
        if (!node.IsMap())
            return false;

        auto readString = [&](char const* key, std::string& target) {
            if (auto const& value = node[key])
                target = value.as<std::string>();
        };
        readString("authority", oidc.authority);
        readString("client-id", oidc.clientId);
        readString("client-secret", oidc.clientSecret);
        readString("client-secret-keychain", oidc.clientSecretKeychain);
        readString("redirect-uri", oidc.redirectUri);
        readString("audience", oidc.audience);
        readString("refresh-token", oidc.refreshToken);

        if (auto const& scopes = node["scopes"]) {
            if (scopes.IsSequence())
                oidc.scopes = scopes.as<std::vector<std::string>>();
            else
                oidc.scopes = {scopes.as<std::string>()};
        }
        if (auto const& mode = node["mode"])
            oidc.mode = mode.as<OidcCredentials::Mode>();
        if (auto const& loginTimeout = node["login-timeout"])
            oidc.loginTimeout = std::chrono::seconds(loginTimeout.as<long>());

        return oidc.mode != OidcCredentials::Mode::RefreshToken || !oidc.refreshToken.empty();
    }
};

}

namespace httpauth
{

namespace
{

std::string convertToRegex(std::string const& scope)
{
    std::string regexPattern = "^";
    for (char c : scope) {
        switch (c) {
        case '*':
            regexPattern += ".*";
            break;
        case '.': case '\\': case '^': case '$': case '|': case '(': case ')':
        case '[': case ']': case '{': case '}': case '?': case '+': case '-': case '!':
            regexPattern += '\\';
            regexPattern += c;
            break;
        default:
            regexPattern += c;
            break;
        }
    }
    regexPattern += ".*$";
    return regexPattern;
}

Settings::Entry entryFromNode(YAML::Node const& node)
{
    Settings::Entry entry;

    if (auto url = node["url"]) {
        entry.urlPatternString = url.as<std::string>();
    }
    else {
        if (auto scope = node["scope"])
            entry.scope = scope.as<std::string>();
        else
            entry.scope = "*";
        entry.urlPatternString = convertToRegex(*entry.scope);
    }
    entry.urlPattern = entry.urlPatternString;

    entry.config = node.as<SessionConfiguration>();

    if (auto basicAuth = node["basic-auth"])
        entry.credentials = basicAuth.as<BasicCredentials>();
    if (auto oidc = node["oidc"]) {
        if (entry.credentials)
            throw logRuntimeError<ConfigurationError>("A settings entry may only carry one of basic-auth and oidc.");
        entry.credentials = oidc.as<OidcCredentials>();
    }

    return entry;
}

std::deque<Settings::Entry> entriesFromDocument(YAML::Node const& document)
{
    YAML::Node list = document;
    if (document.IsMap()) {
        list = document["http-settings"];
        if (!list.IsDefined()) {
            log().debug("No 'http-settings' section found.");
            return {};
        }
    }
    if (list.IsNull())
        return {};

    std::deque<Settings::Entry> result;
    for (auto const& node : list.as<std::vector<YAML::Node>>())
        result.emplace_back(entryFromNode(node));
    return result;
}

}

Settings::Settings()
{
    load();
}

void Settings::load()
{
    auto path = std::getenv("HTTPAUTH_SETTINGS_FILE");
    if (!path || std::string(path).empty()) {
        log().debug("HTTPAUTH_SETTINGS_FILE environment variable is empty.");
        return;
    }
    if (!std::filesystem::is_regular_file(path)) {
        log().debug("The HTTPAUTH_SETTINGS_FILE path '{}' is not a file.", path);
        return;
    }

    try {
        log().debug("Loading HTTP settings from '{}'...", path);
        auto loaded = entriesFromDocument(YAML::LoadFile(path));
        std::unique_lock lock(mutex);
        entries = std::move(loaded);
        log().debug("  ...Done ({} entries).", entries.size());
    }
    catch (YAML::Exception const& e) {
        log().error("Failed to parse HTTP settings at '{}': {}", path, e.what());
    }
    catch (ConfigurationError const& e) {
        log().error("Failed to read HTTP settings from '{}': {}", path, e.what());
    }
    catch (std::regex_error const& e) {
        log().error("Invalid URL pattern in HTTP settings at '{}': {}", path, e.what());
    }
}

void Settings::parse(std::string const& yamlDocument)
{
    std::deque<Entry> loaded;
    try {
        loaded = entriesFromDocument(YAML::Load(yamlDocument));
    }
    catch (YAML::Exception const& e) {
        throw logRuntimeError<ConfigurationError>(stx::format("Invalid HTTP settings: {}", e.what()));
    }
    catch (std::regex_error const& e) {
        throw logRuntimeError<ConfigurationError>(stx::format("Invalid URL pattern in HTTP settings: {}", e.what()));
    }
    std::unique_lock lock(mutex);
    entries = std::move(loaded);
}

SessionConfiguration Settings::operator[](std::string const& url) const
{
    std::shared_lock lock(mutex);
    SessionConfiguration result;
    for (auto const& entry : entries) {
        if (std::regex_match(url, entry.urlPattern))
            result |= entry.config;
    }
    return result;
}

std::optional<CredentialConfig> Settings::credentialsFor(std::string const& url) const
{
    std::shared_lock lock(mutex);
    std::optional<CredentialConfig> result;
    for (auto const& entry : entries) {
        if (entry.credentials && std::regex_match(url, entry.urlPattern))
            result = entry.credentials;
    }
    return result;
}

}
