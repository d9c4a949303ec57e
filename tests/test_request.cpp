#include <gtest/gtest.h>

#include <boost/beast/http.hpp>

#include "feedlink/request.hpp"

using namespace feedlink;

namespace {

    UrlComponents local_url(std::string target) {
        UrlComponents url;
        url.host = "host";
        url.port = "80";
        url.https = false;
        url.target = std::move(target);
        return url;
    }

}  // namespace

TEST(RequestTest, PrepareBeastRequestWithBodyAndQuery) {
    Request req{HttpMethod::Post,
                "/api/orders",
                {{"series", "EQ"}},
                {{"Content-Type", "application/json"}},
                std::string("{\"a\":1}")};

    auto beast_req =
        prepare_beast_request(req, local_url("/api/orders"), "test-agent");

    EXPECT_EQ(beast_req.method(), boost::beast::http::verb::post);
    EXPECT_EQ(beast_req.target(), "/api/orders?series=EQ");
    EXPECT_EQ(beast_req[boost::beast::http::field::host], "host");
    EXPECT_EQ(beast_req[boost::beast::http::field::user_agent], "test-agent");
    EXPECT_EQ(beast_req["Content-Type"], "application/json");
    EXPECT_EQ(beast_req.body(), "{\"a\":1}");
    EXPECT_TRUE(beast_req.keep_alive());
}

TEST(RequestTest, RequestHeadersOverrideDefaults) {
    Request req{HttpMethod::Get, "/x", {}, {{"Accept", "text/csv"}}, std::nullopt};
    std::map<std::string, std::string> defaults{{"Accept", "*/*"},
                                                {"Referer", "https://ref/"}};

    auto beast_req =
        prepare_beast_request(req, local_url("/x"), "ua", defaults, false);

    EXPECT_EQ(beast_req["Accept"], "text/csv");
    EXPECT_EQ(beast_req["Referer"], "https://ref/");
    EXPECT_FALSE(beast_req.keep_alive());
    EXPECT_EQ(beast_req.body(), "");
}

TEST(RequestTest, HeadMapsToHeadVerb) {
    Request req{HttpMethod::Head, "/x", {}, {}, std::nullopt};
    auto beast_req = prepare_beast_request(req, local_url("/x"), "ua");
    EXPECT_EQ(beast_req.method(), boost::beast::http::verb::head);
}
