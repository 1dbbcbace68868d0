#pragma once

#include <memory>
#include <string>

#include "auth-strategy.hpp"
#include "http-client.hpp"
#include "session-configuration.hpp"

namespace httpauth
{

/**
 * Authenticated connection to one API server, as returned by
 * SessionBuilder::connect(). Immutable; safe to share between threads.
 */
class Session
{
public:
    Session(std::string baseUrl,
            AuthStrategy strategy,
            std::shared_ptr<IHttpClient> httpClient,
            SessionConfiguration config);

    /**
     * Send a request with credentials attached, running as many
     * handshake/refresh rounds as the strategy requires.
     * A relative URL is resolved against baseUrl().
     */
    Response send(Request request) const;

    Response get(std::string const& path) const;
    Response post(std::string const& path, std::string body, std::string contentType) const;

    AuthScheme scheme() const;
    std::string const& baseUrl() const { return baseUrl_; }
    SessionConfiguration const& configuration() const { return config_; }
    AuthStrategy const& strategy() const { return strategy_; }

private:
    std::string baseUrl_;
    AuthStrategy strategy_;
    std::shared_ptr<IHttpClient> httpClient_;
    SessionConfiguration config_;
};

}
