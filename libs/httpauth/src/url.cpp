#include "url.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <cctype>
#include <regex>

#include "stx/format.h"

namespace httpauth
{

namespace
{

bool isUnreserved(unsigned char c)
{
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

bool isReserved(unsigned char c)
{
    static const std::string reserved = ":/?#[]@!$&'()*+,;=";
    return c != '\0' && reserved.find(static_cast<char>(c)) != std::string::npos;
}

int hexValue(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

/**
 * Split "userinfo@host:port" into host and port. IPv6 literals
 * keep their brackets.
 */
bool parseAuthority(std::string const& authority, std::string& host, std::uint16_t& port)
{
    auto hostBegin = authority.rfind('@');
    hostBegin = hostBegin == std::string::npos ? 0 : hostBegin + 1;

    auto portSep = std::string::npos;
    if (hostBegin < authority.size() && authority[hostBegin] == '[') {
        auto close = authority.find(']', hostBegin);
        if (close == std::string::npos)
            return false;
        host = authority.substr(hostBegin, close - hostBegin + 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':')
                return false;
            portSep = close + 1;
        }
    }
    else {
        portSep = authority.find(':', hostBegin);
        host = authority.substr(hostBegin, portSep == std::string::npos ? std::string::npos : portSep - hostBegin);
    }

    if (host.empty())
        return false;

    if (portSep != std::string::npos) {
        unsigned long value = 0;
        auto digits = authority.substr(portSep + 1);
        for (auto c : digits) {
            if (!std::isdigit(static_cast<unsigned char>(c)))
                return false;
            value = value * 10 + static_cast<unsigned long>(c - '0');
            if (value > 65535)
                return false;
        }
        port = static_cast<std::uint16_t>(value);
    }
    return true;
}

}

Url Url::parse(std::string const& url)
{
    static const std::regex rfc3986{
        R"(^(([^:/?#]+):)?(//([^/?#]*))?([^?#]*)(\?([^#]*))?(#(.*))?)"};

    std::smatch match;
    if (!std::regex_match(url, match, rfc3986) || !match[2].matched || !match[4].matched)
        throw logRuntimeError<ConfigurationError>(
            stx::format("[Url::parse] '{}' is not an absolute URL.", url));

    Url result;
    result.scheme = match[2].str();
    for (auto& c : result.scheme)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (result.scheme != "http" && result.scheme != "https")
        throw logRuntimeError<ConfigurationError>(
            stx::format("[Url::parse] Unsupported scheme '{}' in URL '{}'.", result.scheme, url));

    if (!parseAuthority(match[4].str(), result.host, result.port))
        throw logRuntimeError<ConfigurationError>(
            stx::format("[Url::parse] Malformed authority in URL '{}'.", url));

    result.path = match[5].str();
    result.query = match[7].str();
    return result;
}

Url Url::resolve(std::string const& reference) const
{
    if (reference.find("://") != std::string::npos)
        return parse(reference);

    Url result = *this;
    result.query.clear();

    auto queryPos = reference.find('?');
    auto refPath = reference.substr(0, queryPos);
    if (queryPos != std::string::npos)
        result.query = reference.substr(queryPos + 1);

    if (refPath.empty())
        result.path = path;
    else if (refPath.front() == '/')
        result.path = refPath;
    else if (path.empty() || path.back() == '/')
        result.path = (path.empty() ? "/" : path) + refPath;
    else
        result.path = path + "/" + refPath;

    return result;
}

std::uint16_t Url::effectivePort() const
{
    if (port)
        return port;
    return scheme == "https" ? 443u : 80u;
}

std::string Url::origin() const
{
    return scheme + "://" + host + (port ? ":" + std::to_string(port) : std::string());
}

std::string Url::pathAndQuery() const
{
    auto result = path.empty() ? std::string("/") : path;
    if (!query.empty())
        result += "?" + query;
    return result;
}

std::string Url::build() const
{
    return origin() + pathAndQuery();
}

void Url::addQuery(std::string const& key, std::string const& value)
{
    if (!query.empty())
        query.push_back('&');
    query += encode(key) + "=" + encode(value);
}

std::multimap<std::string, std::string> Url::queryParams() const
{
    return formDecode(query);
}

std::string Url::encode(std::string const& str)
{
    static const char hex[] = "0123456789ABCDEF";

    std::string result;
    result.reserve(str.size());
    for (unsigned char c : str) {
        if (isUnreserved(c)) {
            result.push_back(static_cast<char>(c));
            continue;
        }
        result.push_back('%');
        result.push_back(hex[c >> 4]);
        result.push_back(hex[c & 0xf]);
    }
    return result;
}

bool Url::isUriText(std::string const& str)
{
    for (unsigned char c : str) {
        if (!isUnreserved(c) && !isReserved(c) && c != '%')
            return false;
    }
    return true;
}

std::string Url::decode(std::string const& str, bool plusAsSpace)
{
    std::string result;
    result.reserve(str.size());
    for (std::string::size_type i = 0; i < str.size(); ++i) {
        auto c = str[i];
        if (c == '%' && i + 2 < str.size() && hexValue(str[i + 1]) >= 0 && hexValue(str[i + 2]) >= 0) {
            result.push_back(static_cast<char>(hexValue(str[i + 1]) * 16 + hexValue(str[i + 2])));
            i += 2;
        }
        else if (c == '+' && plusAsSpace)
            result.push_back(' ');
        else
            result.push_back(c);
    }
    return result;
}

std::string Url::formEncode(std::multimap<std::string, std::string> const& fields)
{
    std::string body;
    for (auto const& [key, value] : fields) {
        if (!body.empty())
            body.push_back('&');
        body += encode(key) + "=" + encode(value);
    }
    return body;
}

std::multimap<std::string, std::string> Url::formDecode(std::string const& body)
{
    std::multimap<std::string, std::string> result;
    std::string::size_type start = 0;
    while (start < body.size()) {
        auto amp = body.find('&', start);
        if (amp == std::string::npos)
            amp = body.size();

        auto pair = body.substr(start, amp - start);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            if (eq == std::string::npos)
                result.emplace(decode(pair), std::string());
            else
                result.emplace(decode(pair.substr(0, eq)), decode(pair.substr(eq + 1)));
        }
        start = amp + 1;
    }
    return result;
}

}
