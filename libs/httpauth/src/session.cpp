#include "session.hpp"
#include "log.hpp"
#include "url.hpp"

namespace httpauth
{

Session::Session(std::string baseUrl,
                 AuthStrategy strategy,
                 std::shared_ptr<IHttpClient> httpClient,
                 SessionConfiguration config)
    : baseUrl_(std::move(baseUrl))
    , strategy_(std::move(strategy))
    , httpClient_(std::move(httpClient))
    , config_(std::move(config))
{}

Response Session::send(Request request) const
{
    request.url = Url::parse(baseUrl_).resolve(request.url).build();

    AuthAttempt attempt;
    if (config_.proxy)
        attempt.proxyHost = config_.proxy->host;
    while (true) {
        auto prepared = request;
        prepareRequest(strategy_, prepared, attempt);
        auto response = httpClient_->send(prepared, config_);
        if (handleResponse(strategy_, response, attempt) == ResponseAction::Done)
            return response;
        log().debug("Retrying {} {} ({})", request.method, request.url, schemeName(scheme()));
    }
}

Response Session::get(std::string const& path) const
{
    Request request;
    request.url = path;
    return send(std::move(request));
}

Response Session::post(std::string const& path, std::string body, std::string contentType) const
{
    Request request;
    request.method = "POST";
    request.url = path;
    request.body = BodyAndContentType{std::move(body), std::move(contentType)};
    return send(std::move(request));
}

AuthScheme Session::scheme() const
{
    return strategyScheme(strategy_);
}

}
