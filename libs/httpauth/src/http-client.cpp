#include "http-client.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "secret-store.hpp"
#include "url.hpp"

#include <httplib.h>

#include <chrono>

#include "stx/format.h"

namespace
{

std::unique_ptr<httplib::Client> makeClient(
    httpauth::Url const& url,
    httpauth::SessionConfiguration const& config,
    bool sslCertStrict)
{
    std::unique_ptr<httplib::Client> client;
    if (config.tls && !config.tls->clientCertPath.empty())
        client = std::make_unique<httplib::Client>(
            url.origin(), config.tls->clientCertPath, config.tls->clientKeyPath);
    else
        client = std::make_unique<httplib::Client>(url.origin());

    auto timeout = static_cast<time_t>(config.timeout().count());
    client->set_connection_timeout(timeout, 0);
    client->set_read_timeout(timeout, 0);
    client->set_write_timeout(timeout, 0);
    // Redirects are followed by HttpLibHttpClient::send() to honor maxRedirects
    client->set_follow_location(false);

    client->enable_server_certificate_verification(sslCertStrict || config.verifySsl());
    if (config.tls && !config.tls->caCertPath.empty())
        client->set_ca_cert_path(config.tls->caCertPath.c_str());

    if (config.proxy) {
        client->set_proxy(config.proxy->host, config.proxy->port);
        if (!config.proxy->user.empty()) {
            auto password = config.proxy->password;
            if (!config.proxy->keychain.empty())
                password = httpauth::KeychainSecretStore::loadPassword(config.proxy->keychain, config.proxy->user);
            client->set_proxy_basic_auth(config.proxy->user, password);
        }
    }

    // Default headers are only sent if the request does not set them itself
    httplib::Headers defaultHeaders{config.headers.begin(), config.headers.end()};
    std::string cookieHeaderValue;
    for (auto const& [name, value] : config.cookies) {
        if (!cookieHeaderValue.empty())
            cookieHeaderValue += "; ";
        cookieHeaderValue += name + "=" + value;
    }
    if (!cookieHeaderValue.empty())
        defaultHeaders.emplace("Cookie", cookieHeaderValue);
    if (defaultHeaders.find("User-Agent") == defaultHeaders.end())
        defaultHeaders.emplace("User-Agent", config.effectiveUserAgent());
    client->set_default_headers(defaultHeaders);

    return client;
}

httpauth::Response sendOnce(
    httpauth::Request const& request,
    httpauth::SessionConfiguration const& config,
    bool sslCertStrict)
{
    using namespace httpauth;

    auto url = Url::parse(request.url);
    auto client = makeClient(url, config, sslCertStrict);

    httplib::Request req;
    req.method = request.method;
    req.path = url.pathAndQuery();
    req.headers = httplib::Headers{request.headers.begin(), request.headers.end()};
    if (request.body) {
        req.body = request.body->body;
        if (!request.body->contentType.empty())
            req.set_header("Content-Type", request.body->contentType);
    }

    httpauth::log().debug("{} {} ...", request.method, url.build());
    auto started = std::chrono::steady_clock::now();
    auto result = client->send(req);
    if (!result) {
        auto error = result.error();
        auto message = stx::format(
            "{} {} failed: {}", request.method, url.build(), httplib::to_string(error));

        // httplib reports an expired read/write timeout as a plain
        // Read/Write error.
        auto elapsed = std::chrono::steady_clock::now() - started;
        auto timedOut = error == httplib::Error::ConnectionTimeout ||
            ((error == httplib::Error::Read || error == httplib::Error::Write) &&
             elapsed + std::chrono::milliseconds(100) >= config.timeout());
        if (timedOut)
            throw logRuntimeError<TimeoutError>(message);
        throw logRuntimeError<ConnectionError>(message);
    }

    Response response;
    response.status = result->status;
    response.headers = Headers{result->headers.begin(), result->headers.end()};
    response.content = std::move(result->body);
    response.url = url.build();
    httpauth::log().debug("  ... status {}, {} bytes.", response.status, response.content.size());
    return response;
}

}

namespace httpauth
{

std::vector<std::string> Response::headerValues(std::string const& name) const
{
    std::vector<std::string> result;
    auto [begin, end] = headers.equal_range(name);
    for (auto it = begin; it != end; ++it)
        result.push_back(it->second);
    return result;
}

HttpLibHttpClient::HttpLibHttpClient()
{
    if (auto sslStrictFlagStr = std::getenv("HTTPAUTH_SSL_STRICT"))
        sslCertStrict_ = !std::string(sslStrictFlagStr).empty();
}

Response HttpLibHttpClient::send(Request const& request, SessionConfiguration const& config)
{
    auto current = request;
    for (auto redirects = 0;; ++redirects) {
        auto response = sendOnce(current, config, sslCertStrict_);
        auto location = response.headerValues("Location");
        if (!response.isRedirect() || location.empty() || config.redirectLimit() <= 0)
            return response;

        if (redirects >= config.redirectLimit())
            throw logRuntimeError<ConnectionError>(stx::format(
                "{} {} exceeded the limit of {} redirect(s).",
                request.method, request.url, config.redirectLimit()), response.status);

        auto from = Url::parse(current.url);
        auto to = from.resolve(location.front());
        log().debug("  ... redirected to {}.", to.build());

        if (response.status == 303 ||
            ((response.status == 301 || response.status == 302) && current.method == "POST")) {
            current.method = "GET";
            current.body.reset();
        }
        if (to.origin() != from.origin())
            current.headers.erase("Authorization");
        current.url = to.build();
    }
}

Response MockHttpClient::send(Request const& request, SessionConfiguration const& config)
{
    if (sendFun)
        return sendFun(request, config);
    return {0, {}, {}, request.url};
}

}
