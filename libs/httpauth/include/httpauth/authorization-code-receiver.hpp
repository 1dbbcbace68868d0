#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace httpauth
{

struct AuthorizationRequest
{
    std::string authorizationUrl;  // where the user has to log in
    std::string redirectUri;       // where the provider sends the user back
    std::string state;
    std::chrono::seconds timeout{60};
};

/**
 * Query parameters of the redirect back from the identity provider.
 */
struct AuthorizationResponse
{
    std::string code;
    std::string state;
    std::string error;
    std::string errorDescription;
};

/**
 * Captures the redirect of an interactive authorization-code login.
 */
class IAuthorizationCodeReceiver
{
public:
    virtual ~IAuthorizationCodeReceiver() = default;

    /**
     * Direct the user to `request.authorizationUrl` and block until the
     * redirect arrives. Throws TimeoutError after `request.timeout`.
     */
    virtual AuthorizationResponse receive(AuthorizationRequest const& request) = 0;
};

/**
 * Listens on the redirect URI's host and port and opens the system
 * browser. The browser tab gets a small "Login successful" page.
 */
class LocalCallbackReceiver : public IAuthorizationCodeReceiver
{
public:
    using BrowserLauncher = std::function<void(std::string const& /* url */)>;

    /**
     * Without a launcher, openSystemBrowser() is used.
     */
    explicit LocalCallbackReceiver(BrowserLauncher launcher = {});

    AuthorizationResponse receive(AuthorizationRequest const& request) override;

    /**
     * Start the platform URL opener (xdg-open, open, ShellExecute)
     * without a shell. URLs that are not plain http(s) URIs are
     * refused. Returns false if no browser was started.
     */
    static bool openSystemBrowser(std::string const& url);

private:
    BrowserLauncher launcher_;
};

}
