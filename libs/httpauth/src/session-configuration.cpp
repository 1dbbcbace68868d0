#include "session-configuration.hpp"
#include "session-configuration-yaml.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

using httpauth::SessionConfiguration;

namespace YAML
{

Node convert<SessionConfiguration::Proxy>::encode(SessionConfiguration::Proxy const& proxy)
{
    Node node;
    node["host"] = proxy.host;
    node["port"] = proxy.port;

    if (!proxy.user.empty()) {
        node["user"] = proxy.user;
        if (!proxy.password.empty())
            node["password"] = proxy.password;
        else if (!proxy.keychain.empty())
            node["keychain"] = proxy.keychain;
    }
    return node;
}

bool convert<SessionConfiguration::Proxy>::decode(Node const& node, SessionConfiguration::Proxy& proxy)
{
    if (!node.IsMap())
        return false;

    auto const& host = node["host"];
    auto const& port = node["port"];
    if (!host || !port)
        return false;

    proxy.host = host.as<std::string>();
    proxy.port = port.as<int>();

    if (auto const& user = node["user"]) {
        proxy.user = user.as<std::string>();
        if (auto const& password = node["password"])
            proxy.password = password.as<std::string>();
        else if (auto const& keychain = node["keychain"])
            proxy.keychain = keychain.as<std::string>();
        else
            return false;
    }
    return true;
}

Node convert<SessionConfiguration::Tls>::encode(SessionConfiguration::Tls const& tls)
{
    Node node;
    node["verify"] = tls.verify;
    if (!tls.caCertPath.empty())
        node["ca-cert"] = tls.caCertPath;
    if (!tls.clientCertPath.empty())
        node["client-cert"] = tls.clientCertPath;
    if (!tls.clientKeyPath.empty())
        node["client-key"] = tls.clientKeyPath;
    return node;
}

bool convert<SessionConfiguration::Tls>::decode(Node const& node, SessionConfiguration::Tls& tls)
{
    if (!node.IsMap())
        return false;

    if (auto const& verify = node["verify"])
        tls.verify = verify.as<bool>();
    if (auto const& caCert = node["ca-cert"])
        tls.caCertPath = caCert.as<std::string>();
    if (auto const& clientCert = node["client-cert"])
        tls.clientCertPath = clientCert.as<std::string>();
    if (auto const& clientKey = node["client-key"])
        tls.clientKeyPath = clientKey.as<std::string>();

    // A key without its certificate is useless
    return tls.clientKeyPath.empty() || !tls.clientCertPath.empty();
}

Node convert<SessionConfiguration>::encode(SessionConfiguration const& config)
{
    Node node;
    if (!config.headers.empty())
        node["headers"] = std::map<std::string, std::string>{config.headers.begin(), config.headers.end()};
    if (!config.cookies.empty())
        node["cookies"] = config.cookies;
    if (config.proxy)
        node["proxy"] = *config.proxy;
    if (config.tls)
        node["tls"] = *config.tls;
    if (config.requestTimeout)
        node["timeout"] = config.requestTimeout->count();
    if (config.maxRedirects)
        node["max-redirects"] = *config.maxRedirects;
    if (config.userAgent)
        node["user-agent"] = *config.userAgent;
    return node;
}

bool convert<SessionConfiguration>::decode(Node const& node, SessionConfiguration& config)
{
    if (!node.IsMap())
        return false;

    if (auto const& headers = node["headers"]) {
        for (auto const& [key, value] : headers.as<std::map<std::string, std::string>>())
            config.headers.emplace(key, value);
    }
    if (auto const& cookies = node["cookies"])
        config.cookies = cookies.as<std::map<std::string, std::string>>();
    if (auto const& proxy = node["proxy"])
        config.proxy = proxy.as<SessionConfiguration::Proxy>();
    if (auto const& tls = node["tls"])
        config.tls = tls.as<SessionConfiguration::Tls>();
    if (auto const& timeout = node["timeout"])
        config.requestTimeout = std::chrono::seconds(timeout.as<long>());
    if (auto const& maxRedirects = node["max-redirects"])
        config.maxRedirects = maxRedirects.as<int>();
    if (auto const& userAgent = node["user-agent"])
        config.userAgent = userAgent.as<std::string>();
    return true;
}

}

namespace httpauth
{

namespace
{

bool isSensitiveHeader(std::string const& name)
{
    CaseInsensitiveLess less;
    for (auto const* sensitive : {"Authorization", "Proxy-Authorization", "Cookie"}) {
        if (!less(name, sensitive) && !less(sensitive, name))
            return true;
    }
    return false;
}

}

bool CaseInsensitiveLess::operator()(std::string const& a, std::string const& b) const
{
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char l, unsigned char r) { return std::tolower(l) < std::tolower(r); });
}

SessionConfiguration::SessionConfiguration(std::string const& yamlConf)
{
    *this = YAML::Load(yamlConf).as<SessionConfiguration>();
}

std::string SessionConfiguration::effectiveUserAgent() const
{
    if (userAgent)
        return *userAgent;
    return std::string("httpauth/") + HTTPAUTH_VERSION;
}

SessionConfiguration& SessionConfiguration::operator |= (SessionConfiguration const& other)
{
    for (auto const& header : other.headers)
        headers.erase(header.first);
    headers.insert(other.headers.begin(), other.headers.end());
    for (auto const& [key, value] : other.cookies)
        cookies[key] = value;
    if (other.proxy)
        proxy = other.proxy;
    if (other.tls)
        tls = other.tls;
    if (other.maxRedirects)
        maxRedirects = other.maxRedirects;
    if (other.requestTimeout)
        requestTimeout = other.requestTimeout;
    if (other.userAgent)
        userAgent = other.userAgent;
    return *this;
}

std::string SessionConfiguration::toYaml() const
{
    return YAML::Dump(YAML::convert<SessionConfiguration>::encode(*this));
}

std::string SessionConfiguration::toSafeString() const
{
    std::ostringstream out;
    out << "SessionConfiguration{";

    out << "headers: [";
    bool first = true;
    for (auto const& [key, value] : headers) {
        out << (first ? "" : ", ") << key << ": ";
        out << (isSensitiveHeader(key) ? "***" : value);
        first = false;
    }
    out << "]";

    if (!cookies.empty()) {
        out << ", cookies: [";
        first = true;
        for (auto const& [key, value] : cookies) {
            out << (first ? "" : ", ") << key << "=***";
            first = false;
        }
        out << "]";
    }

    if (proxy) {
        out << ", proxy: " << proxy->host << ":" << proxy->port;
        if (!proxy->user.empty())
            out << " (user: " << proxy->user << ", password: "
                << (proxy->keychain.empty() ? "***" : "<keychain " + proxy->keychain + ">") << ")";
    }

    out << ", verify-ssl: " << (verifySsl() ? "true" : "false");
    if (tls && !tls->caCertPath.empty())
        out << ", ca-cert: " << tls->caCertPath;
    if (tls && !tls->clientCertPath.empty())
        out << ", client-cert: " << tls->clientCertPath;

    out << ", timeout: " << timeout().count() << "s";
    out << ", max-redirects: " << redirectLimit();
    out << ", user-agent: " << effectiveUserAgent();
    out << "}";
    return out.str();
}

}
