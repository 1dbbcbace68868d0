#pragma once

#include <string>

namespace httpauth
{

std::string base64Encode(std::string const& bytes);
std::string base64Decode(std::string const& encoded);

/**
 * RFC 4648 section 5 alphabet, without padding.
 */
std::string base64UrlEncode(std::string const& bytes);

/**
 * Raw (binary) SHA-256 digest.
 */
std::string sha256(std::string const& data);

/**
 * Cryptographically secure random string over the
 * RFC 7636 unreserved alphabet [A-Za-z0-9-._~].
 */
std::string randomUrlSafeString(std::size_t length);

/**
 * PKCE S256 code challenge for the given verifier.
 */
std::string pkceChallenge(std::string const& codeVerifier);

}
