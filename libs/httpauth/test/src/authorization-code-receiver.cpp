#include <catch2/catch_all.hpp>

#include "httpauth/authorization-code-receiver.hpp"
#include "httpauth/errors.hpp"

#include "local-server.hpp"

#include <filesystem>
#include <random>

namespace fs = std::filesystem;
using namespace httpauth;
using namespace std::chrono;

namespace
{

AuthorizationRequest loginRequest(int port)
{
    AuthorizationRequest request;
    request.authorizationUrl = "https://idp.example.com/oauth/authorize?client_id=api-client&state=state-1";
    request.redirectUri = "http://127.0.0.1:" + std::to_string(port) + "/callback";
    request.state = "state-1";
    request.timeout = seconds(5);
    return request;
}

}

TEST_CASE("Local callback receiver", "[authorization-code-receiver]") {
    auto port = freePort();
    REQUIRE(port > 0);
    auto request = loginRequest(port);

    std::string openedUrl;
    std::string page;

    // Plays the browser: the identity provider redirects it back with `query`.
    auto redirectWith = [&](std::string const& query) {
        return [&, query](std::string const& url) {
            openedUrl = url;
            httplib::Client browser("127.0.0.1", port);
            auto result = browser.Get("/callback?" + query);
            REQUIRE(result);
            REQUIRE(result->status == 200);
            page = result->body;
        };
    };

    SECTION("Code and state are captured") {
        LocalCallbackReceiver receiver(redirectWith("code=auth-code-1&state=state-1"));
        auto response = receiver.receive(request);

        REQUIRE(response.code == "auth-code-1");
        REQUIRE(response.state == "state-1");
        REQUIRE(response.error.empty());
        REQUIRE(openedUrl == request.authorizationUrl);
        REQUIRE_THAT(page, Catch::Matchers::ContainsSubstring("Login successful"));
    }

    SECTION("Refused login shows the failure page") {
        LocalCallbackReceiver receiver(
            redirectWith("error=access_denied&error_description=User%20cancelled&state=state-1"));
        auto response = receiver.receive(request);

        REQUIRE(response.code.empty());
        REQUIRE(response.error == "access_denied");
        REQUIRE(response.errorDescription == "User cancelled");
        REQUIRE_THAT(page, Catch::Matchers::ContainsSubstring("Login failed"));
    }

    SECTION("Redirect path defaults to the root") {
        request.redirectUri = "http://127.0.0.1:" + std::to_string(port);
        LocalCallbackReceiver receiver([&](std::string const&) {
            httplib::Client browser("127.0.0.1", port);
            auto result = browser.Get("/?code=auth-code-2&state=state-1");
            REQUIRE(result);
        });
        REQUIRE(receiver.receive(request).code == "auth-code-2");
    }

    SECTION("No redirect within the timeout") {
        request.timeout = seconds(1);
        LocalCallbackReceiver receiver([](std::string const&) {});
        REQUIRE_THROWS_AS(receiver.receive(request), TimeoutError);
    }

    SECTION("Redirect address cannot be bound") {
        // TEST-NET-1, never assigned to a local interface
        request.redirectUri = "http://192.0.2.1:" + std::to_string(port) + "/callback";
        LocalCallbackReceiver receiver([](std::string const&) {});
        REQUIRE_THROWS_AS(receiver.receive(request), ConnectionError);
    }
}

TEST_CASE("System browser launch", "[authorization-code-receiver][browser]") {
    std::random_device rd;
    auto marker = fs::temp_directory_path() / ("httpauth_browser_" + std::to_string(rd()));
    auto injected = [&](std::string const& prefix, std::string const& suffix) {
        return "https://idp.example.com/oauth/authorize" + prefix + "touch " + marker.string() + suffix;
    };

    SECTION("URLs with shell syntax are refused") {
        REQUIRE_FALSE(LocalCallbackReceiver::openSystemBrowser(injected("$(", ")\"")));
        REQUIRE_FALSE(LocalCallbackReceiver::openSystemBrowser(injected("\"; ", "; \"")));
        REQUIRE_FALSE(LocalCallbackReceiver::openSystemBrowser(injected("`", "`")));
        REQUIRE_FALSE(fs::exists(marker));
    }

    SECTION("Only http(s) URLs are opened") {
        REQUIRE_FALSE(LocalCallbackReceiver::openSystemBrowser("file:///etc/passwd"));
        REQUIRE_FALSE(LocalCallbackReceiver::openSystemBrowser("javascript:alert(1)"));
    }

    SECTION("Receiver without launcher does not run the URL") {
        auto port = freePort();
        REQUIRE(port > 0);
        auto request = loginRequest(port);
        request.authorizationUrl = injected("$(", ")\"");
        request.timeout = seconds(1);

        LocalCallbackReceiver receiver;
        REQUIRE_THROWS_AS(receiver.receive(request), TimeoutError);
        REQUIRE_FALSE(fs::exists(marker));
    }
}
