#include "authorization-code-receiver.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "url.hpp"

#include <httplib.h>

#include <future>
#include <mutex>
#include <thread>
#include <vector>

#if defined(_WIN32)
#include <windows.h>
#include <shellapi.h>
#else
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
extern char** environ;
#endif

#include "stx/format.h"

namespace httpauth
{

namespace
{

const char* LOGIN_SUCCESSFUL_PAGE = R"(<!DOCTYPE html>
<html>
<head><title>Login successful</title></head>
<body>
<h1>Login successful</h1>
<p>You can close this window and return to the application.</p>
</body>
</html>
)";

const char* LOGIN_FAILED_PAGE = R"(<!DOCTYPE html>
<html>
<head><title>Login failed</title></head>
<body>
<h1>Login failed</h1>
<p>The identity provider did not grant access. Check the application log for details.</p>
</body>
</html>
)";

/**
 * Runs Server::listen_after_bind() on a thread until destroyed.
 */
class ListenerThread
{
public:
    explicit ListenerThread(httplib::Server& server)
        : server_(server)
        , thread_([this]() { server_.listen_after_bind(); })
    {
        // stop() is a no-op until the listen loop runs
        server_.wait_until_ready();
    }

    ~ListenerThread()
    {
        server_.stop();
        if (thread_.joinable())
            thread_.join();
    }

private:
    httplib::Server& server_;
    std::thread thread_;
};

}

LocalCallbackReceiver::LocalCallbackReceiver(BrowserLauncher launcher)
    : launcher_(std::move(launcher))
{}

AuthorizationResponse LocalCallbackReceiver::receive(AuthorizationRequest const& request)
{
    auto redirect = Url::parse(request.redirectUri);
    auto path = redirect.path.empty() ? std::string("/") : redirect.path;

    std::promise<AuthorizationResponse> responsePromise;
    auto responseFuture = responsePromise.get_future();
    std::once_flag answered;

    httplib::Server server;
    server.Get(path, [&](httplib::Request const& req, httplib::Response& res) {
        AuthorizationResponse response;
        response.code = req.get_param_value("code");
        response.state = req.get_param_value("state");
        response.error = req.get_param_value("error");
        response.errorDescription = req.get_param_value("error_description");

        res.set_content(response.error.empty() ? LOGIN_SUCCESSFUL_PAGE : LOGIN_FAILED_PAGE, "text/html");
        std::call_once(answered, [&]() { responsePromise.set_value(std::move(response)); });
    });

    auto host = redirect.host;
    if (host.size() > 2 && host.front() == '[')
        host = host.substr(1, host.size() - 2);

    if (!server.bind_to_port(host, redirect.effectivePort()))
        throw logRuntimeError<ConnectionError>(stx::format(
            "Cannot listen for the login redirect on {}:{}.", redirect.host, redirect.effectivePort()));

    ListenerThread listener(server);
    log().info("Waiting for login at {} ...", request.authorizationUrl);
    if (launcher_)
        launcher_(request.authorizationUrl);
    else
        openSystemBrowser(request.authorizationUrl);

    if (responseFuture.wait_for(request.timeout) == std::future_status::timeout)
        throw logRuntimeError<TimeoutError>(stx::format(
            "No login redirect received within {}s.", request.timeout.count()));

    log().debug("  ... redirect received.");
    return responseFuture.get();
}

bool LocalCallbackReceiver::openSystemBrowser(std::string const& url)
{
    // The URL comes from the discovery document, so it must never reach
    // a shell and is handed to the opener as a single argument.
    if (!Url::isUriText(url)) {
        log().warn("Refusing to open login URL with invalid characters: {}", url);
        return false;
    }
    try {
        Url::parse(url);
    }
    catch (ConfigurationError const& e) {
        log().warn("Refusing to open login URL {}: {}", url, e.what());
        return false;
    }

#if defined(_WIN32)
    auto result = reinterpret_cast<INT_PTR>(
        ShellExecuteA(nullptr, "open", url.c_str(), nullptr, nullptr, SW_SHOWNORMAL));
    auto launched = result > 32;
#else
#if defined(__APPLE__)
    const char* opener = "open";
#else
    const char* opener = "xdg-open";
#endif
    std::vector<char*> argv{
        const_cast<char*>(opener),
        const_cast<char*>(url.c_str()),
        nullptr};

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    pid_t pid = 0;
    auto launched = posix_spawnp(&pid, opener, &actions, nullptr, argv.data(), environ) == 0;
    posix_spawn_file_actions_destroy(&actions);

    if (launched) {
        int status = 0;
        launched = waitpid(pid, &status, 0) == pid && WIFEXITED(status) && WEXITSTATUS(status) == 0;
    }
#endif

    if (!launched)
        log().warn("Could not open a browser. Please open {} manually.", url);
    return launched;
}

}
