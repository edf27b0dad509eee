#include <gtest/gtest.h>

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "cluster_cpp/request.hpp"

using namespace cluster_cpp;

TEST(RequestTest, ApplyRequestHeadersSetsFields) {
    boost::beast::http::fields fields;
    std::unordered_map<std::string, std::string> headers = {{"X-Test", "foo"},
                                                            {"X-Bar", "baz"}};
    apply_request_headers(headers, fields);
    EXPECT_EQ(fields["X-Test"], "foo");
    EXPECT_EQ(fields["X-Bar"], "baz");
}

TEST(RequestTest, PrepareBeastRequestBasic) {
    Request req{HttpMethod::Post,
                "http://host:9200/idx/_doc",
                {{"Content-Type", "application/json"}, {"X-Foo", "bar"}},
                std::string("{\"a\":1}")};
    UrlComponents url{false, "host", "9200", "/idx/_doc"};
    auto beast_req = prepare_beast_request(req, url, "test-agent");

    EXPECT_EQ(beast_req.method(), boost::beast::http::verb::post);
    EXPECT_EQ(beast_req.target(), "/idx/_doc");
    EXPECT_EQ(beast_req[boost::beast::http::field::host], "host:9200");
    EXPECT_EQ(beast_req[boost::beast::http::field::user_agent], "test-agent");
    EXPECT_EQ(beast_req["Content-Type"], "application/json");
    EXPECT_EQ(beast_req["X-Foo"], "bar");
    EXPECT_EQ(beast_req.body(), "{\"a\":1}");
    EXPECT_EQ(beast_req[boost::beast::http::field::content_length], "7");
    EXPECT_FALSE(beast_req.keep_alive());
}

TEST(RequestTest, PrepareBeastRequestNoBody) {
    Request req{HttpMethod::Get, "http://host/", {}, std::nullopt};
    UrlComponents url{false, "host", "80", "/"};
    auto beast_req = prepare_beast_request(req, url, "test-agent");

    EXPECT_EQ(beast_req.method(), boost::beast::http::verb::get);
    EXPECT_EQ(beast_req[boost::beast::http::field::host], "host");
    EXPECT_EQ(beast_req.body(), "");
}

TEST(EncodeBodyTest, EmptyBody) {
    auto r = encode_body(RequestBody{});
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(r.value().has_value());
}

TEST(EncodeBodyTest, StringIsSentVerbatim) {
    auto r = encode_body(RequestBody{std::string("{\"raw\": true}")});
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r.value().has_value());
    EXPECT_EQ(*r.value(), "{\"raw\": true}");
}

TEST(EncodeBodyTest, JsonIsDumped) {
    nlohmann::json doc = {{"query", {{"match_all", nlohmann::json::object()}}}};
    auto r = encode_body(RequestBody{doc});
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r.value().has_value());
    EXPECT_EQ(*r.value(), "{\"query\":{\"match_all\":{}}}");
}

TEST(EncodeBodyTest, InvalidUtf8FailsToEncode) {
    nlohmann::json doc = {{"name", std::string("\xff\xfe")}};
    auto r = encode_body(RequestBody{doc});
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::EncodingFailed);
}
