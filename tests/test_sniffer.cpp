#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "cluster_cpp/sniffer.hpp"
#include "cluster_cpp/transport.hpp"
#include "test_server.hpp"

using namespace cluster_cpp;
using namespace cluster_cpp::testing;
using namespace std::chrono_literals;

namespace {

    std::shared_ptr<const NodeClient> make_node_client() {
        return std::make_shared<const NodeClient>(
            std::make_shared<BeastTransport>(), InterceptorList{}, Loggers{},
            "cluster_cpp_gtest");
    }

    struct Fixture {
        explicit Fixture(std::vector<std::string> seeds) {
            pool = ConnectionPool::create(seeds).value();
            SnifferOptions opts;
            opts.seeds = std::move(seeds);
            opts.timeout = 1s;
            opts.interval = 50ms;
            sniffer = std::make_unique<Sniffer>(pool, make_node_client(), opts);
        }

        std::shared_ptr<ConnectionPool> pool;
        std::unique_ptr<Sniffer> sniffer;
    };

    HttpTestServer::Handler nodes_handler(std::vector<std::string> addresses) {
        return [addresses](auto const& req, auto& res) {
            if (req.method() != http::verb::get ||
                req.target() != "/_nodes/http") {
                res.result(http::status::not_found);
                return;
            }
            res.result(http::status::ok);
            res.set(http::field::content_type, "application/json");
            res.body() = nodes_body(addresses);
        };
    }

}  // namespace

TEST(PublishAddressTest, AcceptedForms) {
    EXPECT_EQ(parse_publish_address("127.0.0.1:9200"), "127.0.0.1:9200");
    EXPECT_EQ(parse_publish_address("es-1.local/10.0.0.1:9200"),
              "10.0.0.1:9200");
    EXPECT_EQ(parse_publish_address("inet[/10.0.0.2:9201]"), "10.0.0.2:9201");
    EXPECT_EQ(parse_publish_address("inet[es-3/10.0.0.3:9202]"),
              "10.0.0.3:9202");
    EXPECT_EQ(parse_publish_address("[::1]:9200"), "[::1]:9200");
    EXPECT_EQ(parse_publish_address("es-4/[fe80::1]:9200"), "[fe80::1]:9200");
}

TEST(PublishAddressTest, RejectedForms) {
    EXPECT_FALSE(parse_publish_address("").has_value());
    EXPECT_FALSE(parse_publish_address("hostonly").has_value());
    EXPECT_FALSE(parse_publish_address("host:").has_value());
    EXPECT_FALSE(parse_publish_address("host:abc").has_value());
    EXPECT_FALSE(parse_publish_address(":9200").has_value());
    EXPECT_FALSE(parse_publish_address("[::1]").has_value());
    EXPECT_FALSE(parse_publish_address("::1:9200").has_value());
}

TEST(NodesResponseTest, ParsesMembers) {
    auto r = parse_nodes_response(
        nodes_body({"10.0.0.1:9200", "inet[/10.0.0.2:9200]"}), "http");
    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_EQ(r.value(), (std::vector<std::string>{"http://10.0.0.1:9200",
                                                   "http://10.0.0.2:9200"}));
}

TEST(NodesResponseTest, UsesScheme) {
    auto r = parse_nodes_response(nodes_body({"10.0.0.1:443"}), "https");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), (std::vector<std::string>{"https://10.0.0.1"}));
}

TEST(NodesResponseTest, SkipsMembersWithoutAddress) {
    const std::string body = R"({"nodes":{
        "a":{"name":"no-http"},
        "b":{"http":{"bound_address":["10.0.0.9:9200"]}},
        "c":{"http":{"publish_address":"10.0.0.3:9200"}},
        "d":{"http":{"publish_address":42}}
    }})";
    auto r = parse_nodes_response(body, "http");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), (std::vector<std::string>{"http://10.0.0.3:9200"}));
}

TEST(NodesResponseTest, MalformedOrEmptyIsFailure) {
    EXPECT_EQ(parse_nodes_response("not json", "http").code(),
              Error::Code::InvalidResponse);
    EXPECT_EQ(parse_nodes_response("[]", "http").code(),
              Error::Code::InvalidResponse);
    EXPECT_EQ(parse_nodes_response(R"({"nodes":[]})", "http").code(),
              Error::Code::InvalidResponse);
    EXPECT_EQ(parse_nodes_response(R"({"nodes":{}})", "http").code(),
              Error::Code::InvalidResponse);
}

TEST(SnifferTest, SniffNodeQueriesMemberList) {
    HttpTestServer srv(nodes_handler({"127.0.0.1:9200", "127.0.0.2:9200"}));
    Fixture f({srv.url()});

    auto r = f.sniffer->sniff_node(Context::background(), srv.url());
    ASSERT_TRUE(r.has_value()) << r.error().message;
    ASSERT_EQ(r.value().size(), 2u);
    EXPECT_EQ(r.value()[0]->url(), "http://127.0.0.1:9200");
    EXPECT_FALSE(r.value()[0]->is_dead());
    EXPECT_EQ(srv.last_request().target(), "/_nodes/http");
}

TEST(SnifferTest, SniffNodeNon2xxIsFailure) {
    HttpTestServer srv([](auto const&, auto& res) {
        res.result(http::status::service_unavailable);
    });
    Fixture f({srv.url()});

    auto r = f.sniffer->sniff_node(Context::background(), srv.url());
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::HttpStatus);
    ASSERT_NE(r.error().response, nullptr);
    EXPECT_EQ(r.error().response->status_code, 503);
}

TEST(SnifferTest, SniffReplacesPool) {
    HttpTestServer srv(nodes_handler({"127.0.0.1:9200", "127.0.0.2:9200"}));
    Fixture f({srv.url()});

    auto st = f.sniffer->sniff(Context::background());
    ASSERT_TRUE(st.has_value()) << st.error().message;
    EXPECT_EQ(f.pool->urls(), (std::vector<std::string>{
                                  "http://127.0.0.1:9200",
                                  "http://127.0.0.2:9200"}));
}

TEST(SnifferTest, FailedSniffLeavesPoolUntouched) {
    const std::string dead = refused_url();
    Fixture f({dead});

    auto st = f.sniffer->sniff(Context::background());
    ASSERT_TRUE(st.has_error());
    EXPECT_EQ(st.error().code, Error::Code::NoUsableNode);
    EXPECT_EQ(f.pool->urls(), (std::vector<std::string>{dead}));
}

TEST(SnifferTest, FirstAnswerWinsAndSlowCandidatesAreReleased) {
    SilentServer slow;
    HttpTestServer fast(nodes_handler({"127.0.0.1:9200"}));
    Fixture f({slow.url(), fast.url()});

    const auto start = std::chrono::steady_clock::now();
    auto st = f.sniffer->sniff(Context::background().with_timeout(10s));
    const auto took = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(st.has_value()) << st.error().message;
    EXPECT_LT(took, 5s);
    EXPECT_EQ(f.pool->urls(),
              (std::vector<std::string>{"http://127.0.0.1:9200"}));
    EXPECT_TRUE(slow.wait_for_closed(1, 1s));
}

TEST(SnifferTest, TimedOutSniffReleasesConnection) {
    SilentServer slow;
    Fixture f({slow.url()});

    auto st = f.sniffer->sniff(Context::background().with_timeout(100ms));
    ASSERT_TRUE(st.has_error());
    EXPECT_EQ(st.error().code, Error::Code::DeadlineExceeded);
    EXPECT_TRUE(slow.wait_for_closed(1, 1s));
}

TEST(SnifferTest, StartupFailureTakesAtLeastTheTimeout) {
    Fixture f({refused_url()});

    const auto start = std::chrono::steady_clock::now();
    auto st = f.sniffer->sniff_startup(Context::background(), 300ms);
    const auto took = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(st.has_error());
    EXPECT_EQ(st.error().code, Error::Code::NoUsableNode);
    EXPECT_GE(took, 300ms);
    EXPECT_LT(took, 5s);
}

TEST(SnifferTest, StartupSucceedsOnFirstAnswer) {
    HttpTestServer srv(nodes_handler({"127.0.0.3:9200"}));
    Fixture f({srv.url()});

    auto st = f.sniffer->sniff_startup(Context::background(), 2s);
    ASSERT_TRUE(st.has_value()) << st.error().message;
    EXPECT_EQ(f.pool->urls(),
              (std::vector<std::string>{"http://127.0.0.3:9200"}));
}

TEST(SnifferTest, PeriodicDriverRefreshesPool) {
    HttpTestServer srv(nodes_handler({"127.0.0.4:9200"}));
    Fixture f({srv.url()});

    {
        std::jthread driver([&](std::stop_token st) {
            f.sniffer->run(std::move(st));
        });
        const auto until = std::chrono::steady_clock::now() + 5s;
        while (f.pool->find("http://127.0.0.4:9200") == nullptr &&
               std::chrono::steady_clock::now() < until) {
            std::this_thread::sleep_for(10ms);
        }
    }

    EXPECT_NE(f.pool->find("http://127.0.0.4:9200"), nullptr);
    EXPECT_GE(srv.request_count(), 1);
}
