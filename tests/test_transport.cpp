#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

#include "cluster_cpp/context.hpp"
#include "cluster_cpp/transport.hpp"
#include "test_server.hpp"

using namespace cluster_cpp;
using namespace cluster_cpp::testing;
using namespace std::chrono_literals;

namespace {

    TransportConfiguration make_cfg() {
        TransportConfiguration cfg{};
        cfg.user_agent = "cluster_cpp_gtest";
        cfg.max_body_bytes = 1024 * 1024;
        return cfg;
    }

    Request get(std::string url) {
        return Request{HttpMethod::Get, std::move(url), {}, std::nullopt};
    }

}  // namespace

TEST(BeastTransport, GetOk) {
    HttpTestServer srv([](auto const& req, auto& res) {
        if (req.target() == "/ok?pretty=true") {
            res.result(http::status::ok);
            res.set(http::field::content_type, "text/plain");
            res.body() = "hello";
            return;
        }
        res.result(http::status::not_found);
    });

    BeastTransport t(make_cfg());
    auto r = t.round_trip(Context::background(),
                          get(srv.url() + "/ok?pretty=true"));
    ASSERT_FALSE(r.has_error()) << r.error().message;
    EXPECT_EQ(r.value().status_code, 200);
    EXPECT_EQ(r.value().body, "hello");
    EXPECT_EQ(r.value().headers.at("Content-Type"), "text/plain");

    auto seen = srv.last_request();
    EXPECT_EQ(seen[http::field::user_agent], "cluster_cpp_gtest");
    EXPECT_EQ(seen[http::field::host],
              "127.0.0.1:" + std::to_string(srv.port()));
}

TEST(BeastTransport, PostSendsBodyAndHeaders) {
    HttpTestServer srv([](auto const& req, auto& res) {
        res.result(http::status::created);
        res.body() = req.body();
    });

    BeastTransport t(make_cfg());
    Request req{HttpMethod::Post,
                srv.url() + "/idx/_doc",
                {{"Content-Type", "application/json"}, {"X-Opaque-Id", "42"}},
                std::string("{\"a\":1}")};
    auto r = t.round_trip(Context::background(), req);
    ASSERT_FALSE(r.has_error()) << r.error().message;
    EXPECT_EQ(r.value().status_code, 201);
    EXPECT_EQ(r.value().body, "{\"a\":1}");

    auto seen = srv.last_request();
    EXPECT_EQ(seen.method(), http::verb::post);
    EXPECT_EQ(seen.target(), "/idx/_doc");
    EXPECT_EQ(seen["Content-Type"], "application/json");
    EXPECT_EQ(seen["X-Opaque-Id"], "42");
}

TEST(BeastTransport, HeadHasNoBody) {
    HttpTestServer srv([](auto const&, auto& res) {
        res.result(http::status::ok);
    });

    BeastTransport t(make_cfg());
    Request req{HttpMethod::Head, srv.url() + "/", {}, std::nullopt};
    auto r = t.round_trip(Context::background(), req);
    ASSERT_FALSE(r.has_error()) << r.error().message;
    EXPECT_EQ(r.value().status_code, 200);
    EXPECT_TRUE(r.value().body.empty());
    EXPECT_EQ(srv.last_request().method(), http::verb::head);
}

TEST(BeastTransport, ServerErrorIsStillAResponse) {
    HttpTestServer srv([](auto const&, auto& res) {
        res.result(http::status::internal_server_error);
        res.body() = "boom";
    });

    BeastTransport t(make_cfg());
    auto r = t.round_trip(Context::background(), get(srv.url() + "/"));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value().status_code, 500);
    EXPECT_FALSE(r.value().is_success());
    EXPECT_EQ(r.value().body, "boom");
}

TEST(BeastTransport, RefusedConnection) {
    BeastTransport t(make_cfg());
    auto r = t.round_trip(Context::background(), get(refused_url() + "/"));
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::ConnectionFailed);
}

TEST(BeastTransport, BodyLimit) {
    HttpTestServer srv([](auto const&, auto& res) {
        res.result(http::status::ok);
        res.body() = std::string(1000, 'x');
    });

    auto cfg = make_cfg();
    cfg.max_body_bytes = 10;
    BeastTransport t(cfg);
    auto r = t.round_trip(Context::background(), get(srv.url() + "/"));
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::ReceiveFailed);
}

TEST(BeastTransport, RequestTimeout) {
    SilentServer srv;
    auto cfg = make_cfg();
    cfg.request_timeout = 100ms;
    BeastTransport t(cfg);

    auto r = t.round_trip(Context::background(), get(srv.url() + "/"));
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::Timeout);
    EXPECT_TRUE(srv.wait_for_closed(1, 1s));
}

TEST(BeastTransport, ContextDeadlineAbortsAndClosesSocket) {
    SilentServer srv;
    BeastTransport t(make_cfg());

    const auto start = std::chrono::steady_clock::now();
    auto r = t.round_trip(Context::background().with_timeout(100ms),
                          get(srv.url() + "/"));
    const auto took = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::DeadlineExceeded);
    EXPECT_LT(took, 2s);
    EXPECT_TRUE(srv.wait_for_closed(1, 1s));
}

TEST(BeastTransport, CancelAbortsAndClosesSocket) {
    SilentServer srv;
    BeastTransport t(make_cfg());
    auto ctx = Context::background().with_cancel();

    std::thread canceler([ctx] {
        std::this_thread::sleep_for(100ms);
        ctx.cancel();
    });
    auto r = t.round_trip(ctx, get(srv.url() + "/"));
    canceler.join();

    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::Canceled);
    EXPECT_TRUE(srv.wait_for_closed(1, 1s));
}

TEST(BeastTransport, CanceledContextNeverConnects) {
    HttpTestServer srv([](auto const&, auto& res) {
        res.result(http::status::ok);
    });
    BeastTransport t(make_cfg());
    auto ctx = Context::background().with_cancel();
    ctx.cancel();

    auto r = t.round_trip(ctx, get(srv.url() + "/"));
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::Canceled);
    EXPECT_EQ(srv.request_count(), 0);
}

TEST(BeastTransport, UnknownMethodReturnsError) {
    BeastTransport t(make_cfg());
    Request req{static_cast<HttpMethod>(0x7f), "http://127.0.0.1:1/", {},
                std::nullopt};
    auto r = t.round_trip(Context::background(), req);
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::Unknown);
}

TEST(BeastTransport, InvalidUrlErrors) {
    BeastTransport t(make_cfg());
    auto r = t.round_trip(Context::background(), get("127.0.0.1:1234/ok"));
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::InvalidUrl);
}
