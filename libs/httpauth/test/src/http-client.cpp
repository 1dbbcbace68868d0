#include <catch2/catch_all.hpp>

#include "httpauth/errors.hpp"
#include "httpauth/http-client.hpp"

#include "local-server.hpp"

#include <chrono>
#include <thread>

using namespace httpauth;
using namespace std::chrono;

TEST_CASE("HttpLibHttpClient", "[http-client]") {
    LocalServer local;
    REQUIRE(local.port() > 0);

    HttpLibHttpClient client;
    SessionConfiguration config;
    config.requestTimeout = seconds(5);

    SECTION("Request and configuration reach the server") {
        std::string apiKey, requestId, cookie, userAgent, contentType, body;
        local.server.Post("/items", [&](httplib::Request const& req, httplib::Response& res) {
            apiKey = req.get_header_value("X-Api-Key");
            requestId = req.get_header_value("X-Request-Id");
            cookie = req.get_header_value("Cookie");
            userAgent = req.get_header_value("User-Agent");
            contentType = req.get_header_value("Content-Type");
            body = req.body;
            res.status = 201;
            res.set_header("X-Item", "item-7");
            res.set_content("created", "text/plain");
        });
        local.start();

        config.headers.emplace("X-Api-Key", "key-1");
        config.cookies["session"] = "abc";
        config.userAgent = "items-client/2.0";

        Request request;
        request.method = "POST";
        request.url = local.url("/items");
        request.headers.emplace("X-Request-Id", "r-1");
        request.body = BodyAndContentType{R"({"name": "x"})", "application/json"};

        auto response = client.send(request, config);
        REQUIRE(response.status == 201);
        REQUIRE(response.content == "created");
        REQUIRE(response.headerValues("x-item") == std::vector<std::string>{"item-7"});
        REQUIRE(response.url == local.url("/items"));

        REQUIRE(apiKey == "key-1");
        REQUIRE(requestId == "r-1");
        REQUIRE(cookie == "session=abc");
        REQUIRE(userAgent == "items-client/2.0");
        REQUIRE(contentType == "application/json");
        REQUIRE(body == R"({"name": "x"})");
    }

    SECTION("Default User-Agent") {
        std::string userAgent;
        local.server.Get("/", [&](httplib::Request const& req, httplib::Response& res) {
            userAgent = req.get_header_value("User-Agent");
            res.set_content("ok", "text/plain");
        });
        local.start();

        Request request;
        request.url = local.url("/");
        REQUIRE(client.send(request, config).status == 200);
        REQUIRE(userAgent == config.effectiveUserAgent());
    }

    SECTION("Server slower than the request timeout") {
        local.server.Get("/slow", [](httplib::Request const&, httplib::Response& res) {
            std::this_thread::sleep_for(seconds(2));
            res.set_content("late", "text/plain");
        });
        local.start();

        config.requestTimeout = seconds(1);
        Request request;
        request.url = local.url("/slow");
        REQUIRE_THROWS_AS(client.send(request, config), TimeoutError);
    }

    SECTION("Nobody listening") {
        Request request;
        request.url = "http://127.0.0.1:" + std::to_string(freePort()) + "/";
        REQUIRE_THROWS_AS(client.send(request, config), ConnectionError);
    }
}

TEST_CASE("HttpLibHttpClient redirects", "[http-client][redirect]") {
    std::vector<std::string> authorization;
    std::string resultMethod;

    LocalServer local;
    REQUIRE(local.port() > 0);

    // /hop/3 -> /hop/2 -> /hop/1 -> /hop/0
    local.server.Get(R"(/hop/(\d+))", [&](httplib::Request const& req, httplib::Response& res) {
        authorization.push_back(req.get_header_value("Authorization"));
        auto remaining = std::stoi(req.matches[1].str());
        if (remaining == 0) {
            res.set_content("arrived", "text/plain");
            return;
        }
        res.set_redirect("/hop/" + std::to_string(remaining - 1));
    });
    local.server.Get("/elsewhere", [&](httplib::Request const& req, httplib::Response& res) {
        authorization.push_back(req.get_header_value("Authorization"));
        res.set_redirect("http://localhost:" + std::to_string(local.port()) + "/hop/0");
    });
    local.server.Post("/submit", [](httplib::Request const&, httplib::Response& res) {
        res.set_redirect("/result", 303);
    });
    local.server.Get("/result", [&](httplib::Request const& req, httplib::Response& res) {
        resultMethod = req.method;
        res.set_content("done", "text/plain");
    });
    local.start();

    HttpLibHttpClient client;
    SessionConfiguration config;
    config.requestTimeout = seconds(5);

    Request request;
    request.url = local.url("/hop/3");
    request.headers.emplace("Authorization", "Basic dXNlcjpwdw==");

    SECTION("Followed within the limit") {
        config.maxRedirects = 3;
        auto response = client.send(request, config);
        REQUIRE(response.status == 200);
        REQUIRE(response.content == "arrived");
        REQUIRE(response.url == local.url("/hop/0"));
        // Same origin: credentials are kept
        REQUIRE(authorization == std::vector<std::string>(4, "Basic dXNlcjpwdw=="));
    }

    SECTION("Limit exceeded") {
        config.maxRedirects = 2;
        try {
            client.send(request, config);
            FAIL("redirect limit should be enforced");
        }
        catch (ConnectionError const& e) {
            REQUIRE(e.status == 302);
        }
        REQUIRE(authorization.size() == 3);
    }

    SECTION("Zero disables redirects") {
        config.maxRedirects = 0;
        auto response = client.send(request, config);
        REQUIRE(response.status == 302);
        REQUIRE(response.headerValues("Location") == std::vector<std::string>{"/hop/2"});
        REQUIRE(authorization.size() == 1);
    }

    SECTION("Credentials are not sent to another origin") {
        request.url = local.url("/elsewhere");
        auto response = client.send(request, config);
        REQUIRE(response.status == 200);
        REQUIRE(authorization == std::vector<std::string>{"Basic dXNlcjpwdw==", ""});
    }

    SECTION("See Other turns a POST into a GET") {
        request.method = "POST";
        request.url = local.url("/submit");
        request.body = BodyAndContentType{"a=1", "application/x-www-form-urlencoded"};
        auto response = client.send(request, config);
        REQUIRE(response.status == 200);
        REQUIRE(response.content == "done");
        REQUIRE(resultMethod == "GET");
    }
}
