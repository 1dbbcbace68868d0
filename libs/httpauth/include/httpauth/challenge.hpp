#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace httpauth
{

/** ASCII case-insensitive equality, as used for scheme and parameter names. */
bool equalsIgnoreCase(std::string_view a, std::string_view b);

/**
 * Auth-params in the order the server sent them. Keys are unique
 * (compared case-insensitively); a repeated key overwrites the value
 * of its first occurrence.
 */
using ChallengeParameters = std::vector<std::pair<std::string, std::string>>;

/**
 * One scheme advertised by a WWW-Authenticate header, e.g.
 * `Basic realm="api"` or `Negotiate` or `Negotiate YIIBhgYGKwYB...`.
 */
struct Challenge
{
    std::string scheme;
    ChallengeParameters parameters;

    /** Set instead of `parameters` for `<scheme> <token68>` challenges. */
    std::optional<std::string> token68;

    bool is(std::string_view schemeName) const;

    std::optional<std::string> parameter(std::string_view name) const;
    void setParameter(std::string name, std::string value);

    bool operator== (Challenge const& other) const;
    bool operator!= (Challenge const& other) const { return !(*this == other); }
};

/**
 * Fragment of a header which the parser could not interpret
 * and skipped. Position is the byte offset into the header value.
 */
struct ParseDiagnostic
{
    std::size_t position = 0;
    std::string fragment;
    std::string reason;
};

/**
 * Parse the value of a WWW-Authenticate (or Proxy-Authenticate) header.
 * Multiple comma-separated challenges are returned in order.
 *
 * Never throws: malformed fragments are skipped, logged at debug
 * level, and appended to `diagnostics` if given.
 */
std::vector<Challenge> parseChallenges(
    std::string_view headerValue,
    std::vector<ParseDiagnostic>* diagnostics = nullptr);

/**
 * Parse all instances of a repeated header, in order.
 */
std::vector<Challenge> parseChallenges(
    std::vector<std::string> const& headerValues,
    std::vector<ParseDiagnostic>* diagnostics = nullptr);

/**
 * Render challenges as one header value. Parameter values are always
 * quoted, so the result parses back to the same challenges.
 */
std::string formatChallenge(Challenge const& challenge);
std::string formatChallenges(std::vector<Challenge> const& challenges);

}
