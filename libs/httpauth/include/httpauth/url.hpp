#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace httpauth
{

/**
 * Parsed absolute http(s) URL. The query is kept in its
 * encoded form; use queryParams() for decoded pairs.
 */
struct Url
{
    std::string scheme;
    std::string host;
    std::uint16_t port = 0u;
    std::string path;
    std::string query;

    /**
     * Split an absolute URL into its components, following the
     * reference regex in RFC 3986, Appendix B.
     *
     * Throws ConfigurationError.
     */
    static Url parse(std::string const& url);

    /**
     * Resolve a reference against this URL. Absolute references
     * are parsed as-is, "/x" replaces the path, "x" is appended
     * to the current path.
     */
    Url resolve(std::string const& reference) const;

    /** Explicit port, or the scheme default (80/443). */
    std::uint16_t effectivePort() const;

    std::string origin() const;       /* scheme://host[:port] */
    std::string pathAndQuery() const; /* path?query, "/" if empty */
    std::string build() const;        /* origin + pathAndQuery */

    /**
     * Append a query pair, percent-encoding key and value.
     */
    void addQuery(std::string const& key, std::string const& value);

    /**
     * Decode the query into key/value pairs.
     */
    std::multimap<std::string, std::string> queryParams() const;

    /**
     * Percent-encode everything but RFC 3986 unreserved characters.
     */
    static std::string encode(std::string const& str);

    /**
     * True if the string only holds characters RFC 3986 allows in a
     * URI: unreserved, gen-delims, sub-delims and '%'.
     */
    static bool isUriText(std::string const& str);

    /**
     * Percent-decode. If plusAsSpace is set, '+' decodes to ' '
     * as in application/x-www-form-urlencoded.
     */
    static std::string decode(std::string const& str, bool plusAsSpace = true);

    /**
     * Build an application/x-www-form-urlencoded body.
     */
    static std::string formEncode(std::multimap<std::string, std::string> const& fields);

    /**
     * Parse an application/x-www-form-urlencoded body.
     */
    static std::multimap<std::string, std::string> formDecode(std::string const& body);
};

}
