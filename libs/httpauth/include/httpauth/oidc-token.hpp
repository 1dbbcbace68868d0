#pragma once

#include <chrono>
#include <string>

namespace httpauth
{

/**
 * Access/refresh token pair with its absolute expiry, computed
 * from `expires_in` when the token was issued.
 */
struct OidcToken
{
    using Clock = std::chrono::system_clock;

    static constexpr std::chrono::seconds DEFAULT_EXPIRES_IN{3600};

    std::string accessToken;
    std::string refreshToken;  // empty if the provider issued none
    Clock::time_point expiresAt;

    /**
     * True once `now` is within `skew` of the expiry.
     */
    bool needsRefresh(Clock::time_point now, std::chrono::seconds skew) const
    {
        return now >= expiresAt - skew;
    }

    /**
     * Secret store form:
     * {"access_token": ..., "refresh_token": ..., "expires_at": <epoch seconds>}
     */
    std::string toJson() const;

    /**
     * Throws Error if the document is not a stored token.
     */
    static OidcToken fromJson(std::string const& json);

    /**
     * Parse a token endpoint response. A missing `expires_in` means
     * DEFAULT_EXPIRES_IN; a missing `refresh_token` keeps `previousRefreshToken`.
     * Throws ConnectionError if there is no `access_token`.
     */
    static OidcToken fromTokenResponse(
        std::string const& body,
        Clock::time_point issuedAt,
        std::string const& previousRefreshToken = {});

    bool operator== (OidcToken const& other) const
    {
        return accessToken == other.accessToken &&
               refreshToken == other.refreshToken &&
               expiresAt == other.expiresAt;
    }
    bool operator!= (OidcToken const& other) const { return !(*this == other); }
};

/**
 * Stable secret store key for tokens of one client at one authority.
 */
std::string secretStoreKey(std::string const& authority, std::string const& clientId);

}
