#include "crypto.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <vector>

namespace httpauth
{

std::string base64Encode(std::string const& bytes)
{
    if (bytes.empty())
        return {};

    // EVP_EncodeBlock writes 4 output bytes per 3 input bytes plus NUL
    std::vector<unsigned char> out(4 * ((bytes.size() + 2) / 3) + 1);
    auto len = EVP_EncodeBlock(
        out.data(),
        reinterpret_cast<const unsigned char*>(bytes.data()),
        static_cast<int>(bytes.size()));
    return std::string(reinterpret_cast<char*>(out.data()), len);
}

std::string base64Decode(std::string const& encoded)
{
    if (encoded.empty())
        return {};

    std::string padded = encoded;
    while (padded.size() % 4 != 0)
        padded.push_back('=');

    std::vector<unsigned char> out(3 * padded.size() / 4 + 1);
    auto len = EVP_DecodeBlock(
        out.data(),
        reinterpret_cast<const unsigned char*>(padded.data()),
        static_cast<int>(padded.size()));
    if (len < 0)
        throw logRuntimeError<Error>("Invalid base64 input.");

    // EVP_DecodeBlock does not account for padding
    auto padding = padded.size() - padded.find_last_not_of('=') - 1;
    return std::string(reinterpret_cast<char*>(out.data()), len - padding);
}

std::string base64UrlEncode(std::string const& bytes)
{
    auto result = base64Encode(bytes);
    for (auto& c : result) {
        if (c == '+')
            c = '-';
        else if (c == '/')
            c = '_';
    }
    auto end = result.find_last_not_of('=');
    result.erase(end == std::string::npos ? 0 : end + 1);
    return result;
}

std::string sha256(std::string const& data)
{
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);
    return std::string(reinterpret_cast<char*>(digest), SHA256_DIGEST_LENGTH);
}

std::string randomUrlSafeString(std::size_t length)
{
    static const char alphabet[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz"
        "-._~";
    constexpr auto alphabetSize = sizeof(alphabet) - 1;

    // Bytes above the largest multiple of the alphabet size are rejected to avoid modulo bias
    constexpr auto limit = 256 - (256 % alphabetSize);

    std::string result;
    result.reserve(length);
    std::vector<unsigned char> random(length);
    while (result.size() < length) {
        if (RAND_bytes(random.data(), static_cast<int>(random.size())) != 1)
            throw logRuntimeError<Error>("Failed to obtain secure random bytes.");
        for (auto byte : random) {
            if (byte >= limit || result.size() == length)
                continue;
            result.push_back(alphabet[byte % alphabetSize]);
        }
    }
    return result;
}

std::string pkceChallenge(std::string const& codeVerifier)
{
    return base64UrlEncode(sha256(codeVerifier));
}

}
