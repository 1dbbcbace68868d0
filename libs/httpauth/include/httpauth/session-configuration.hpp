#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace httpauth
{

struct CaseInsensitiveLess
{
    bool operator()(std::string const& a, std::string const& b) const;
};

using Headers = std::multimap<std::string, std::string, CaseInsensitiveLess>;

/**
 * Cross-cutting options for the connection to an API server
 * (or to an identity provider), independent of the
 * authentication scheme:
 *   - Extra Headers and Cookies
 *   - Optional Proxy-Config
 *   - TLS trust material and client certificate
 *   - Redirect policy and request timeout
 *
 * Owned by the caller; strategies only read it.
 */
struct SessionConfiguration
{
    SessionConfiguration() = default;
    explicit SessionConfiguration(std::string const& yamlConf);

    static constexpr std::chrono::seconds DEFAULT_REQUEST_TIMEOUT{31};
    static constexpr int DEFAULT_MAX_REDIRECTS = 10;

    struct Proxy {
        std::string host;
        int port = 0;
        std::string user;
        std::string password;
        std::string keychain;
    };

    struct Tls {
        bool verify = true;
        std::string caCertPath;     // optional custom trust store (PEM)
        std::string clientCertPath; // optional
        std::string clientKeyPath;  // optional
    };

    Headers headers;
    std::map<std::string, std::string> cookies;
    std::optional<Proxy> proxy;
    std::optional<Tls> tls;
    std::optional<int> maxRedirects;
    std::optional<std::chrono::seconds> requestTimeout;
    std::optional<std::string> userAgent;

    bool verifySsl() const { return !tls || tls->verify; }
    int redirectLimit() const { return maxRedirects.value_or(DEFAULT_MAX_REDIRECTS); }
    std::chrono::seconds timeout() const { return requestTimeout.value_or(DEFAULT_REQUEST_TIMEOUT); }

    /**
     * Configured User-Agent, or "httpauth/<version>".
     */
    std::string effectiveUserAgent() const;

    /**
     * Merge another configuration into this one. Maps are united,
     * set optionals of `other` win.
     */
    SessionConfiguration& operator |= (SessionConfiguration const& other);

    /**
     * Convert this configuration to a YAML string, which may
     * be passed to the `SessionConfiguration(yamlConf)` constructor.
     */
    std::string toYaml() const;

    /**
     * Create a human-readable summary of this configuration for logging,
     * with passwords, cookies and Authorization header values masked.
     */
    std::string toSafeString() const;
};

}
