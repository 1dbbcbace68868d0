#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "session-configuration.hpp"

namespace httpauth
{

struct BodyAndContentType {
    std::string body;
    std::string contentType;
};

using OptionalBodyAndContentType = std::optional<BodyAndContentType>;

struct Request {
    std::string method = "GET";
    std::string url;
    Headers headers;
    OptionalBodyAndContentType body;
};

struct Response {
    int status = 0;
    Headers headers;
    std::string content;
    std::string url;

    /** All values of a (case-insensitive) header, in order. */
    std::vector<std::string> headerValues(std::string const& name) const;

    bool isSuccess() const { return status >= 200 && status < 300; }
    bool isRedirect() const { return status >= 300 && status < 400; }
    bool isAuthChallenge() const { return status == 401 || status == 403; }
};

/**
 * Transport capability. Implementations apply the session configuration
 * (TLS, proxy, timeouts, default headers) and perform exactly one
 * HTTP exchange per call.
 *
 * Throws ConnectionError on transport failure, TimeoutError if the
 * configured timeout elapsed.
 */
class IHttpClient
{
public:
    virtual ~IHttpClient() = default;

    virtual Response send(Request const& request,
                          SessionConfiguration const& config) = 0;
};

class HttpLibHttpClient : public IHttpClient
{
public:
    HttpLibHttpClient();

    /**
     * Follows at most `config.redirectLimit()` redirects, throws
     * TimeoutError once `config.timeout()` expired and
     * ConnectionError for other transport failures.
     */
    Response send(Request const& request,
                  SessionConfiguration const& config) override;

private:
    bool sslCertStrict_ = false;
};

class MockHttpClient : public IHttpClient
{
public:
    std::function<
        Response(Request const& /* request */,
                 SessionConfiguration const& /* config */)
    > sendFun;

    Response send(Request const& request,
                  SessionConfiguration const& config) override;
};

}
