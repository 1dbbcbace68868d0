#pragma once

#include <deque>
#include <optional>
#include <regex>
#include <shared_mutex>
#include <string>

#include "credentials.hpp"
#include "session-configuration.hpp"

namespace httpauth
{

/**
 * Loads per-URL session configuration and credentials from the YAML
 * file named by HTTPAUTH_SETTINGS_FILE. The file is either a list of
 * entries, or a map with such a list under `http-settings`:
 *
 *   http-settings:
 *     - scope: https://*.example.com
 *       headers: {X-Tenant: acme}
 *       basic-auth: {user: joe, keychain: example-password}
 *     - url: https://idp\.example\.com/.*
 *       tls: {ca-cert: /etc/ssl/corp.pem}
 */
struct Settings
{
    struct Entry
    {
        std::optional<std::string> scope;
        std::regex urlPattern;
        std::string urlPatternString;

        SessionConfiguration config;
        std::optional<CredentialConfig> credentials;
    };

    /**
     * Reads HTTPAUTH_SETTINGS_FILE if it is set. A missing or broken
     * file is logged and yields empty settings.
     */
    Settings();

    void load();

    /**
     * Replace all entries by those of the given YAML document.
     * Throws ConfigurationError if it cannot be parsed.
     */
    void parse(std::string const& yamlDocument);

    /**
     * Merged configuration of all entries matching the URL,
     * later entries win.
     */
    SessionConfiguration operator[](std::string const& url) const;

    /**
     * Credentials of the last matching entry which has any.
     */
    std::optional<CredentialConfig> credentialsFor(std::string const& url) const;

    std::deque<Entry> entries;
    mutable std::shared_mutex mutex;
};

}
