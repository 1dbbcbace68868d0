#include "challenge.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>

#include "stx/string.h"

namespace httpauth
{

namespace
{

bool isTokenChar(char c)
{
    switch (c) {
    case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
    case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
        return true;
    default:
        return std::isalnum(static_cast<unsigned char>(c)) != 0;
    }
}

bool isToken68Char(char c)
{
    switch (c) {
    case '-': case '.': case '_': case '~': case '+': case '/':
        return true;
    default:
        return std::isalnum(static_cast<unsigned char>(c)) != 0;
    }
}

bool isSpace(char c)
{
    return c == ' ' || c == '\t';
}

/**
 * Single pass over one header value. The grammar is RFC 7235:
 *
 *   challenge  = auth-scheme [ 1*SP ( token68 / #auth-param ) ]
 *   auth-param = token BWS "=" BWS ( token / quoted-string )
 *
 * A token is a new scheme unless it is followed by "=".
 */
class ChallengeScanner
{
public:
    ChallengeScanner(std::string_view input, std::vector<ParseDiagnostic>* diagnostics)
        : input_(input)
        , diagnostics_(diagnostics)
    {}

    std::vector<Challenge> run()
    {
        while (true) {
            skipSeparators();
            if (atEnd())
                break;

            auto start = pos_;
            auto token = readToken();
            if (token.empty()) {
                skipFragment(start, "expected a scheme or parameter name");
                continue;
            }

            skipSpaces();
            if (peek() == '=') {
                ++pos_;
                if (result_.empty()) {
                    skipFragment(start, "parameter before any scheme");
                    continue;
                }
                readParameterValue(start, std::string(token));
                continue;
            }

            result_.push_back(Challenge{std::string(token), {}, {}});
            readToken68();
        }
        return std::move(result_);
    }

private:
    bool atEnd() const { return pos_ >= input_.size(); }
    char peek() const { return atEnd() ? '\0' : input_[pos_]; }

    void skipSpaces()
    {
        while (!atEnd() && isSpace(input_[pos_]))
            ++pos_;
    }

    void skipSeparators()
    {
        while (!atEnd() && (isSpace(input_[pos_]) || input_[pos_] == ','))
            ++pos_;
    }

    std::string_view readToken()
    {
        auto start = pos_;
        while (!atEnd() && isTokenChar(input_[pos_]))
            ++pos_;
        return input_.substr(start, pos_ - start);
    }

    /**
     * After a scheme: accept `token68` if it is the only thing up
     * to the next comma. Otherwise rewind and let the main loop
     * read auth-params.
     */
    void readToken68()
    {
        auto rewind = pos_;
        skipSpaces();
        auto start = pos_;
        while (!atEnd() && isToken68Char(input_[pos_]))
            ++pos_;
        if (pos_ == start) {
            pos_ = rewind;
            return;
        }
        while (peek() == '=')
            ++pos_;
        auto end = pos_;
        skipSpaces();
        if (atEnd() || peek() == ',') {
            result_.back().token68 = std::string(input_.substr(start, end - start));
            return;
        }
        pos_ = rewind;
    }

    void readParameterValue(std::size_t start, std::string name)
    {
        skipSpaces();
        if (peek() == '"') {
            auto value = readQuotedString();
            if (!value) {
                note(start, "unterminated quoted string");
                pos_ = input_.size();
                return;
            }
            result_.back().setParameter(std::move(name), std::move(*value));
        }
        else {
            auto valueStart = pos_;
            while (!atEnd() && input_[pos_] != ',' && !isSpace(input_[pos_]) && input_[pos_] != '"')
                ++pos_;
            result_.back().setParameter(
                std::move(name), std::string(input_.substr(valueStart, pos_ - valueStart)));
        }

        skipSpaces();
        if (!atEnd() && peek() != ',' && !isTokenChar(peek()))
            skipFragment(pos_, "unexpected character after parameter");
    }

    std::optional<std::string> readQuotedString()
    {
        std::string value;
        ++pos_;  // opening quote
        while (!atEnd()) {
            auto c = input_[pos_++];
            if (c == '"')
                return value;
            if (c == '\\' && !atEnd())
                c = input_[pos_++];
            value.push_back(c);
        }
        return {};
    }

    /** Drop everything up to the next comma which is not quoted. */
    void skipFragment(std::size_t start, char const* reason)
    {
        bool quoted = false;
        while (!atEnd()) {
            auto c = input_[pos_];
            if (!quoted && c == ',')
                break;
            if (c == '\\' && quoted)
                ++pos_;
            else if (c == '"')
                quoted = !quoted;
            ++pos_;
        }
        note(start, reason);
    }

    void note(std::size_t start, char const* reason)
    {
        auto end = std::min(pos_, input_.size());
        ParseDiagnostic diagnostic{start, std::string(input_.substr(start, end - start)), reason};
        log().debug("WWW-Authenticate: dropped '{}' at position {} ({}).",
                    diagnostic.fragment, diagnostic.position, diagnostic.reason);
        if (diagnostics_)
            diagnostics_->push_back(std::move(diagnostic));
    }

    std::string_view input_;
    std::vector<ParseDiagnostic>* diagnostics_;
    std::size_t pos_ = 0;
    std::vector<Challenge> result_;
};

std::string quote(std::string const& value)
{
    std::string result = "\"";
    for (auto c : value) {
        if (c == '"' || c == '\\')
            result.push_back('\\');
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

}

bool equalsIgnoreCase(std::string_view a, std::string_view b)
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

bool Challenge::is(std::string_view schemeName) const
{
    return equalsIgnoreCase(scheme, schemeName);
}

std::optional<std::string> Challenge::parameter(std::string_view name) const
{
    for (auto const& [key, value] : parameters) {
        if (equalsIgnoreCase(key, name))
            return value;
    }
    return {};
}

void Challenge::setParameter(std::string name, std::string value)
{
    for (auto& [key, existing] : parameters) {
        if (equalsIgnoreCase(key, name)) {
            existing = std::move(value);
            return;
        }
    }
    parameters.emplace_back(std::move(name), std::move(value));
}

bool Challenge::operator== (Challenge const& other) const
{
    if (!is(other.scheme) || token68 != other.token68)
        return false;
    if (parameters.size() != other.parameters.size())
        return false;
    for (auto const& [key, value] : parameters) {
        if (other.parameter(key) != value)
            return false;
    }
    return true;
}

std::vector<Challenge> parseChallenges(
    std::string_view headerValue,
    std::vector<ParseDiagnostic>* diagnostics)
{
    return ChallengeScanner(headerValue, diagnostics).run();
}

std::vector<Challenge> parseChallenges(
    std::vector<std::string> const& headerValues,
    std::vector<ParseDiagnostic>* diagnostics)
{
    std::vector<Challenge> result;
    for (auto const& value : headerValues) {
        auto challenges = parseChallenges(std::string_view(value), diagnostics);
        result.insert(result.end(),
                      std::make_move_iterator(challenges.begin()),
                      std::make_move_iterator(challenges.end()));
    }
    return result;
}

std::string formatChallenge(Challenge const& challenge)
{
    if (challenge.token68)
        return challenge.scheme + " " + *challenge.token68;
    if (challenge.parameters.empty())
        return challenge.scheme;

    std::vector<std::string> params;
    for (auto const& [key, value] : challenge.parameters)
        params.push_back(key + "=" + quote(value));
    return challenge.scheme + " " + stx::join(params.begin(), params.end(), ", ");
}

std::string formatChallenges(std::vector<Challenge> const& challenges)
{
    std::vector<std::string> parts;
    for (auto const& challenge : challenges)
        parts.push_back(formatChallenge(challenge));
    return stx::join(parts.begin(), parts.end(), ", ");
}

}
